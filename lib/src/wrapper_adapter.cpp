#include <ujson/mapper.hpp>
#include <ujson/wrapper_adapter.hpp>

namespace uj {
auto WrapperAdapter::write(void const* object, TypeInfo const& runtime, Mapper const& mapper) const -> Json {
	return make_envelope(serialize_type(runtime), mapper.write_object(runtime, object), m_keys);
}

auto WrapperAdapter::read(Json const& json, TypeInfo const& declared, Mapper const& mapper) const -> Instance {
	if (!json.is_object()) { throw Error{.type = Error::Type::InvalidEnvelope, .token = "expected object"}; }
	auto const& tag = json[m_keys.type_key];
	if (!tag.is_string()) { throw Error{.type = Error::Type::InvalidEnvelope, .token = "missing '" + m_keys.type_key + "'"}; }
	auto const& type = deserialize_type(tag.as_string_view(), mapper.registry());
	if (!TypeRegistry::is_assignable(declared, type)) {
		throw Error{.type = Error::Type::UnknownType, .token = type.name + " is not a " + declared.name};
	}
	return mapper.read_new(type, json[m_keys.data_key]);
}

auto WrapperAdapter::serialize_type(TypeInfo const& type) const -> std::string { return type.name; }

auto WrapperAdapter::deserialize_type(std::string_view const tag, TypeRegistry const& registry) const -> TypeInfo const& {
	auto const* ret = registry.find(tag);
	if (!ret) { throw Error{.type = Error::Type::UnknownType, .token = std::string{tag}}; }
	return *ret;
}
} // namespace uj
