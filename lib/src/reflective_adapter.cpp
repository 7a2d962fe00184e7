#include <detail/reflective_adapter.hpp>
#include <ujson/codec.hpp>
#include <ujson/mapper.hpp>

namespace uj::detail {
ReflectiveAdapter::ReflectiveAdapter(Mapper const& mapper, TypeInfo const& type) : m_mapper(&mapper), m_type(&type), m_lineage(type.lineage()) {}

void ReflectiveAdapter::write(void const* object, Json& out) const {
	auto const serialize_nulls = m_mapper->is_set(MapperFlag::SerializeNulls);
	if (!out.is_object()) { out.set_object(); }
	for (auto const* level : m_lineage) {
		auto const* instance = m_type->cast_to(object, *level);
		for (auto const& field : level->fields) {
			auto value = field.write(instance, Context{.mapper = m_mapper, .field = &field});
			if (value.is_null() && !serialize_nulls) { continue; }
			out.insert_or_assign(field.name, std::move(value));
		}
	}
}

void ReflectiveAdapter::read(Json const& json, void* object, Converters const& scoped) const {
	if (!json.is_object()) { throw_type_mismatch("object", json); }
	for (auto const* level : m_lineage) {
		auto* instance = m_type->cast_to(object, *level);
		for (auto const& field : level->fields) {
			// absent and null both keep the member's current value
			auto const* value = json.find(field.name);
			if (value == nullptr || value->is_null()) { continue; }
			field.read(*value, instance, Context{.mapper = m_mapper, .converters = &scoped, .field = &field});
		}
	}
}
} // namespace uj::detail
