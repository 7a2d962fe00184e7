#include <ujson/log.hpp>
#include <ujson/type_registry.hpp>
#include <algorithm>

namespace uj {
namespace {
[[noreturn]] void fail(ConfigError::Type const type, std::string const& message) {
	g_log.error(message);
	throw ConfigError{type, message};
}
} // namespace

auto TypeRegistry::find(std::string_view const name) const -> TypeInfo const* {
	auto const it = std::ranges::find_if(m_types, [name](auto const& info) { return info->name == name; });
	if (it == m_types.end()) { return nullptr; }
	return it->get();
}

auto TypeRegistry::find(std::type_index const type) const -> TypeInfo const* {
	auto const it = m_by_type.find(type);
	if (it == m_by_type.end()) { return nullptr; }
	return it->second;
}

auto TypeRegistry::find_enum(std::type_index const type) const -> EnumInfo const* {
	auto const it = std::ranges::find(m_enums, type, &EnumInfo::type);
	if (it == m_enums.end()) { return nullptr; }
	return &*it;
}

auto TypeRegistry::require_parent(std::type_index const parent, std::string_view const child) const -> TypeInfo const* {
	auto const* ret = find(parent);
	if (!ret) { fail(ConfigError::Type::UnknownParentType, std::string{child} + " has unregistered parent type " + parent.name()); }
	return ret;
}

auto TypeRegistry::insert(std::unique_ptr<TypeInfo> info) -> TypeInfo& {
	if (find(info->name) != nullptr || find(info->type) != nullptr) {
		fail(ConfigError::Type::DuplicateType, "type " + info->name + " is already registered");
	}
	auto& ret = *m_types.emplace_back(std::move(info));
	m_by_type.emplace(ret.type, &ret);
	g_log.debug("registered type " + ret.name);
	return ret;
}

void TypeRegistry::insert_enum(EnumInfo info) {
	if (find_enum(info.type) != nullptr) { fail(ConfigError::Type::DuplicateType, "enum " + info.name + " is already registered"); }
	m_enums.push_back(std::move(info));
}
} // namespace uj
