#include <detail/union_adapter.hpp>
#include <ujson/codec.hpp>
#include <ujson/log.hpp>
#include <ujson/tree_rewriter.hpp>

namespace uj::detail {
namespace {
[[nodiscard]] auto to_discriminator_value(UnionFieldSpec const& spec, Json const& json) -> std::string {
	switch (json.get_type()) {
	case JsonType::String: return json.as_string();
	case JsonType::Boolean: return json.as_bool() ? "true" : "false";
	case JsonType::Number: return json.serialize(SerializeOptions{.flags = SerializeFlag::NoSpaces});
	default: throw Error{.type = Error::Type::InvalidDiscriminator, .token = spec.discriminator};
	}
}
} // namespace

UnionAdapter::UnionAdapter(std::vector<UnionFieldSpec> specs, std::unique_ptr<Adapter const> delegate, std::shared_ptr<WrapperAdapter const> envelope)
	: m_specs(std::move(specs)), m_delegate(std::move(delegate)), m_envelope(std::move(envelope)) {}

auto UnionAdapter::resolve(UnionFieldSpec const& spec, Json const& tree) -> MappingEntry const* {
	auto const* discriminator = tree.find(spec.discriminator);
	if (discriminator == nullptr || discriminator->is_null()) { throw Error{.type = Error::Type::MissingDiscriminator, .token = spec.discriminator}; }
	auto const value = to_discriminator_value(spec, *discriminator);
	auto const* ret = spec.find(value);
	if (ret == nullptr) { g_log.debug(spec.owner->name + "." + spec.field->name + ": no mapping for '" + value + "', passing through"); }
	return ret;
}

void UnionAdapter::write(void const* object, Json& out) const {
	m_delegate->write(object, out);
	for (auto const& spec : m_specs) {
		auto const* entry = resolve(spec, out);
		if (entry == nullptr) { continue; }
		flatten(out, spec.field->name, spec.serialized_name(*entry));
	}
}

void UnionAdapter::read(Json const& json, void* object, Converters const& /*scoped*/) const {
	if (!json.is_object()) { throw_type_mismatch("object", json); }
	// union slots are rewritten on a copy; registrations live for this call only
	auto tree = json;
	auto converters = Converters{};
	for (auto const& spec : m_specs) {
		auto const* entry = resolve(spec, tree);
		if (entry == nullptr) { continue; }
		wrap(tree, spec.field->name, spec.serialized_name(*entry), m_envelope->serialize_type(*entry->type), m_envelope->keys());
		converters.add(*spec.content, m_envelope, spec.field);
	}
	m_delegate->read(tree, object, converters);
}
} // namespace uj::detail
