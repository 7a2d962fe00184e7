#pragma once
#include <ujson/type_registry.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uj {
/// \brief Resolved TypeMapping.
struct MappingEntry {
	std::string value{};
	TypeInfo const* type{};
	/// \brief Empty means the union field's own name.
	std::string serialized_name{};
};

/// \brief Validated union field of a type. Immutable once built.
struct UnionFieldSpec {
	/// \brief Type whose adapter owns this spec.
	TypeInfo const* owner{};
	FieldInfo const* field{};
	/// \brief Declared content type (pointee of the field).
	TypeInfo const* content{};
	std::string discriminator{};
	std::vector<MappingEntry> mappings{};

	/// \brief Obtain the first entry whose value matches.
	[[nodiscard]] auto find(std::string_view value) const -> MappingEntry const*;
	/// \brief Obtain the wire name of the union slot for entry.
	[[nodiscard]] auto serialized_name(MappingEntry const& entry) const -> std::string_view;
};

/// \brief Collect union fields of type, and of its ancestors if include_inherited.
/// Each field appears once.
[[nodiscard]] auto collect_union_fields(TypeInfo const& type, bool include_inherited) -> std::vector<FieldInfo const*>;

/// \brief Validate union fields and resolve their mappings.
/// Throws ConfigError on a missing discriminator, unknown / incompatible mapping type, or duplicate mapping value.
[[nodiscard]] auto validate_union_fields(TypeRegistry const& registry, TypeInfo const& type, std::span<FieldInfo const* const> fields, bool include_inherited)
	-> std::vector<UnionFieldSpec>;
} // namespace uj
