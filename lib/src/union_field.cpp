#include <ujson/log.hpp>
#include <ujson/union_field.hpp>
#include <algorithm>

namespace uj {
namespace {
[[noreturn]] void fail(ConfigError::Type const type, std::string const& message) {
	g_log.error(message);
	throw ConfigError{type, message};
}

[[nodiscard]] auto describe(TypeInfo const& type, FieldInfo const& field) {
	return type.name + " has union field '" + field.name + "'";
}

[[nodiscard]] auto resolve_content(TypeRegistry const& registry, TypeInfo const& type, FieldInfo const& field) -> TypeInfo const& {
	if (!field.content_type) { fail(ConfigError::Type::IncompatibleMapping, describe(type, field) + " which is not an owning pointer"); }
	auto const* ret = registry.find(*field.content_type);
	if (!ret) { fail(ConfigError::Type::IncompatibleMapping, describe(type, field) + " of unregistered type " + field.content_type->name()); }
	return *ret;
}

[[nodiscard]] auto resolve_entry(TypeRegistry const& registry, UnionFieldSpec const& spec, TypeMapping const& mapping) -> MappingEntry {
	auto const prefix = describe(*spec.owner, *spec.field) + " of type " + spec.content->name;
	auto const* mapped = registry.find(mapping.type);
	if (!mapped) { fail(ConfigError::Type::UnknownMappingType, prefix + " with unknown mapping type " + mapping.type); }
	if (!TypeRegistry::is_assignable(*spec.content, *mapped)) {
		fail(ConfigError::Type::IncompatibleMapping, prefix + " with invalid mapping type " + mapping.type);
	}
	if (spec.find(mapping.value) != nullptr) {
		fail(ConfigError::Type::DuplicateMapping, prefix + " with duplicate mapping value '" + mapping.value + "'");
	}
	return MappingEntry{.value = mapping.value, .type = mapped, .serialized_name = mapping.serialized_name};
}

// a flattened or wrapped slot must not replace the discriminator or a sibling member
void check_serialized_name(UnionFieldSpec const& spec, MappingEntry const& entry) {
	auto const name = spec.serialized_name(entry);
	if (name == spec.field->name) { return; }
	auto const prefix = describe(*spec.owner, *spec.field) + " with serialized name '" + std::string{name} + "'";
	if (name == spec.discriminator) { fail(ConfigError::Type::NameCollision, prefix + " colliding with its discriminator"); }
	if (spec.owner->find_field(name, true) != nullptr) { fail(ConfigError::Type::NameCollision, prefix + " colliding with another field"); }
}
} // namespace

auto UnionFieldSpec::find(std::string_view const value) const -> MappingEntry const* {
	auto const it = std::ranges::find(mappings, value, &MappingEntry::value);
	if (it == mappings.end()) { return nullptr; }
	return &*it;
}

auto UnionFieldSpec::serialized_name(MappingEntry const& entry) const -> std::string_view {
	if (entry.serialized_name.empty()) { return field->name; }
	return entry.serialized_name;
}

auto collect_union_fields(TypeInfo const& type, bool const include_inherited) -> std::vector<FieldInfo const*> {
	auto ret = std::vector<FieldInfo const*>{};
	for (auto const* level = &type; level != nullptr; level = level->parent) {
		for (auto const& field : level->fields) {
			if (!field.is_union() || std::ranges::find(ret, &field) != ret.end()) { continue; }
			ret.push_back(&field);
		}
		if (!include_inherited) { break; }
	}
	return ret;
}

auto validate_union_fields(TypeRegistry const& registry, TypeInfo const& type, std::span<FieldInfo const* const> fields, bool const include_inherited)
	-> std::vector<UnionFieldSpec> {
	auto ret = std::vector<UnionFieldSpec>{};
	ret.reserve(fields.size());
	for (auto const* field : fields) {
		auto const& config = *field->union_config;
		if (type.find_field(config.discriminator, include_inherited) == nullptr) {
			fail(ConfigError::Type::MissingDiscriminator, describe(type, *field) + " with invalid discriminator field '" + config.discriminator + "'");
		}

		auto spec = UnionFieldSpec{
			.owner = &type,
			.field = field,
			.content = &resolve_content(registry, type, *field),
			.discriminator = config.discriminator,
		};
		spec.mappings.reserve(config.mappings.size());
		for (auto const& mapping : config.mappings) {
			spec.mappings.push_back(resolve_entry(registry, spec, mapping));
			check_serialized_name(spec, spec.mappings.back());
		}
		ret.push_back(std::move(spec));
	}
	return ret;
}
} // namespace uj
