#pragma once
#include <ujson/codec.hpp>
#include <ujson/error.hpp>
#include <ujson/type_info.hpp>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace uj {
/// \brief Declares the fields of a registered type.
template <typename Type>
class TypeBuilder {
  public:
	explicit TypeBuilder(TypeInfo& info) : m_info(&info) {}

	/// \brief Register a data member declared on Type.
	template <typename Value>
	auto field(std::string name, Value Type::*member) -> TypeBuilder& {
		add_field<Value>(std::move(name), member, {});
		return *this;
	}

	/// \brief Register a union data member declared on Type.
	/// Its concrete type is selected by the discriminator field named in config.
	template <OwningPointerT Value>
	auto union_field(std::string name, Value Type::*member, Union config) -> TypeBuilder& {
		add_field<Value>(std::move(name), member, std::move(config));
		return *this;
	}

	[[nodiscard]] auto info() const -> TypeInfo const& { return *m_info; }

  private:
	template <typename Value>
	void add_field(std::string name, Value Type::*member, std::optional<Union> config) {
		m_info->fields.push_back(FieldInfo{
			.name = std::move(name),
			.value_type = typeid(Value),
			.content_type = content_type_of<Value>(),
			.union_config = std::move(config),
			.write = [member](void const* owner, Context const& context) { return Codec<Value>::write(static_cast<Type const*>(owner)->*member, context); },
			.read = [member](Json const& json, void* owner, Context const& context) { Codec<Value>::read(json, static_cast<Type*>(owner)->*member, context); },
		});
	}

	TypeInfo* m_info;
};

/// \brief Explicit registry of mappable types and enums.
/// Populate before constructing a Mapper; lookups are const and thread safe afterwards.
class TypeRegistry {
  public:
	/// \brief Register Type under a stable name.
	/// Parent (if not void) must be a registered base of Type.
	/// Throws ConfigError on duplicate name / type, or unregistered Parent.
	template <typename Type, typename Parent = void>
	auto add(std::string name) -> TypeBuilder<Type> {
		auto info = std::make_unique<TypeInfo>();
		info->name = std::move(name);
		info->type = typeid(Type);
		if constexpr (!std::is_abstract_v<Type> && std::is_default_constructible_v<Type>) {
			// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
			info->create = []() -> void* { return new Type{}; };
		}
		// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
		info->destroy = [](void* object) { delete static_cast<Type*>(object); };
		if constexpr (!std::is_void_v<Parent>) {
			static_assert(std::is_base_of_v<Parent, Type>, "Parent must be a base of Type");
			info->parent = require_parent(typeid(Parent), info->name);
			info->upcast = [](void* object) -> void* { return static_cast<Parent*>(static_cast<Type*>(object)); };
		}
		return TypeBuilder<Type>{insert(std::move(info))};
	}

	/// \brief Register an enum with the JSON names of its enumerators.
	template <EnumT Type>
	void add_enum(std::string name, std::initializer_list<std::pair<Type, std::string_view>> values) {
		auto info = EnumInfo{.name = std::move(name), .type = typeid(Type)};
		for (auto const& [value, value_name] : values) {
			info.values.emplace_back(static_cast<std::int64_t>(std::to_underlying(value)), std::string{value_name});
		}
		insert_enum(std::move(info));
	}

	[[nodiscard]] auto find(std::string_view name) const -> TypeInfo const*;
	[[nodiscard]] auto find(std::type_index type) const -> TypeInfo const*;

	template <typename Type>
	[[nodiscard]] auto find() const -> TypeInfo const* {
		return find(std::type_index{typeid(Type)});
	}

	[[nodiscard]] auto find_enum(std::type_index type) const -> EnumInfo const*;

	/// \brief Check if an instance of from can be stored in a slot declared as to.
	[[nodiscard]] static auto is_assignable(TypeInfo const& to, TypeInfo const& from) -> bool { return from.is_a(to); }

	[[nodiscard]] auto size() const -> std::size_t { return m_types.size(); }

  private:
	[[nodiscard]] auto require_parent(std::type_index parent, std::string_view child) const -> TypeInfo const*;
	auto insert(std::unique_ptr<TypeInfo> info) -> TypeInfo&;
	void insert_enum(EnumInfo info);

	std::vector<std::unique_ptr<TypeInfo>> m_types{};
	std::unordered_map<std::type_index, TypeInfo const*> m_by_type{};
	std::vector<EnumInfo> m_enums{};
};
} // namespace uj
