#include <ujson/converter.hpp>
#include <ranges>

namespace uj {
auto Instance::release_as(TypeInfo const& target) -> void* {
	if (!m_object) { return nullptr; }
	auto* ret = m_type->cast_to(m_object, target);
	if (!ret) { throw Error{.type = Error::Type::TypeMismatch, .token = m_type->name + " is not a " + target.name}; }
	m_object = nullptr;
	return ret;
}

void Instance::reset() {
	if (!m_object) { return; }
	m_type->destroy(m_object);
	m_object = nullptr;
}

void Converters::add(TypeInfo const& declared, std::shared_ptr<Converter const> converter, FieldInfo const* field) {
	if (!converter) { return; }
	m_entries.push_back(Entry{.declared = &declared, .field = field, .converter = std::move(converter)});
}

auto Converters::find(TypeInfo const& declared, FieldInfo const* field) const -> Converter const* {
	for (auto const& entry : std::views::reverse(m_entries)) {
		if (entry.declared != &declared) { continue; }
		if (entry.field != nullptr && entry.field != field) { continue; }
		return entry.converter.get();
	}
	return nullptr;
}
} // namespace uj
