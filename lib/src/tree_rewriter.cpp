#include <ujson/tree_rewriter.hpp>

auto uj::make_envelope(std::string_view const type_tag, Json data, EnvelopeKeys const& keys) -> Json {
	auto ret = Json::empty_object();
	ret.insert_or_assign(keys.type_key, Json{type_tag});
	ret.insert_or_assign(keys.data_key, std::move(data));
	return ret;
}

void uj::flatten(Json& object, std::string_view const field_name, std::string_view const serialized_name) {
	if (field_name == serialized_name) { return; }
	object.rename_key(field_name, std::string{serialized_name});
}

void uj::wrap(Json& object, std::string_view const field_name, std::string_view const serialized_name, std::string_view const type_tag,
			  EnvelopeKeys const& keys) {
	if (!object.rename_key(serialized_name, std::string{field_name})) { return; }
	auto* slot = object.find(field_name);
	*slot = make_envelope(type_tag, std::move(*slot), keys);
}
