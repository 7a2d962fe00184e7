#pragma once
#include <ujson/json.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace uj {
class Mapper;
class Converters;
struct FieldInfo;

/// \brief Associates a discriminator value with a concrete type.
struct TypeMapping {
	/// \brief Discriminator value, in string form.
	std::string value{};
	/// \brief Registered name of the concrete type.
	std::string type{};
	/// \brief Wire name of the union field for this mapping. Empty means the field's own name.
	std::string serialized_name{};
};

/// \brief Declared configuration of a union field.
struct Union {
	/// \brief Name of the sibling field that selects the concrete type.
	std::string discriminator{"type"};
	std::vector<TypeMapping> mappings{};
};

/// \brief Per-call state passed to value codecs.
struct Context {
	Mapper const* mapper{};
	/// \brief Converters scoped to the object currently being read.
	Converters const* converters{};
	/// \brief Field currently being read or written, if any.
	FieldInfo const* field{};
};

/// \brief Describes a data member of a registered type.
struct FieldInfo {
	using Write = std::function<Json(void const* owner, Context const& context)>;
	using Read = std::function<void(Json const& json, void* owner, Context const& context)>;

	std::string name{};
	std::type_index value_type{typeid(void)};
	/// \brief Pointee type of owning pointer fields.
	std::optional<std::type_index> content_type{};
	std::optional<Union> union_config{};
	Write write{};
	Read read{};

	[[nodiscard]] auto is_union() const -> bool { return union_config.has_value(); }
};

/// \brief Describes a registered type.
struct TypeInfo {
	using Create = void* (*)();
	using Destroy = void (*)(void*);
	using Upcast = void* (*)(void*);

	/// \brief Stable identifier, used as the envelope type tag.
	std::string name{};
	std::type_index type{typeid(void)};
	TypeInfo const* parent{};
	/// \brief Fields declared on this level only. Addresses are stable.
	std::deque<FieldInfo> fields{};
	/// \brief nullptr if abstract (or not default constructible).
	Create create{};
	Destroy destroy{};
	/// \brief Convert pointer to this type to pointer to parent.
	Upcast upcast{};

	[[nodiscard]] auto is_abstract() const -> bool { return create == nullptr; }
	[[nodiscard]] auto find_field(std::string_view field_name, bool include_inherited) const -> FieldInfo const*;
	/// \brief Check if this is base or derives from it.
	[[nodiscard]] auto is_a(TypeInfo const& base) const -> bool;
	/// \brief Convert pointer to this type to pointer to an ancestor (or self).
	/// \returns nullptr if target is not an ancestor.
	[[nodiscard]] auto cast_to(void* object, TypeInfo const& target) const -> void*;
	[[nodiscard]] auto cast_to(void const* object, TypeInfo const& target) const -> void const*;
	/// \brief Obtain levels from root ancestor down to this.
	[[nodiscard]] auto lineage() const -> std::vector<TypeInfo const*>;
};

/// \brief Describes a registered enum.
struct EnumInfo {
	std::string name{};
	std::type_index type{typeid(void)};
	std::vector<std::pair<std::int64_t, std::string>> values{};

	[[nodiscard]] auto to_name(std::int64_t value) const -> std::optional<std::string_view>;
	[[nodiscard]] auto to_value(std::string_view value_name) const -> std::optional<std::int64_t>;
};
} // namespace uj
