#include <ujson/type_info.hpp>
#include <algorithm>

namespace uj {
auto TypeInfo::find_field(std::string_view const field_name, bool const include_inherited) const -> FieldInfo const* {
	for (auto const* level = this; level != nullptr; level = level->parent) {
		auto const it = std::ranges::find(level->fields, field_name, &FieldInfo::name);
		if (it != level->fields.end()) { return &*it; }
		if (!include_inherited) { break; }
	}
	return nullptr;
}

auto TypeInfo::is_a(TypeInfo const& base) const -> bool {
	for (auto const* level = this; level != nullptr; level = level->parent) {
		if (level == &base) { return true; }
	}
	return false;
}

auto TypeInfo::cast_to(void* object, TypeInfo const& target) const -> void* {
	for (auto const* level = this; level != nullptr; level = level->parent) {
		if (level == &target) { return object; }
		if (!level->upcast) { break; }
		object = level->upcast(object);
	}
	return nullptr;
}

auto TypeInfo::cast_to(void const* object, TypeInfo const& target) const -> void const* {
	// NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
	return cast_to(const_cast<void*>(object), target);
}

auto TypeInfo::lineage() const -> std::vector<TypeInfo const*> {
	auto ret = std::vector<TypeInfo const*>{};
	for (auto const* level = this; level != nullptr; level = level->parent) { ret.push_back(level); }
	std::ranges::reverse(ret);
	return ret;
}

auto EnumInfo::to_name(std::int64_t const value) const -> std::optional<std::string_view> {
	auto const it = std::ranges::find(values, value, &std::pair<std::int64_t, std::string>::first);
	if (it == values.end()) { return {}; }
	return it->second;
}

auto EnumInfo::to_value(std::string_view const value_name) const -> std::optional<std::int64_t> {
	auto const it = std::ranges::find(values, value_name, &std::pair<std::int64_t, std::string>::second);
	if (it == values.end()) { return {}; }
	return it->first;
}
} // namespace uj
