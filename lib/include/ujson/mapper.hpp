#pragma once
#include <ujson/adapter.hpp>
#include <ujson/codec.hpp>
#include <ujson/tree_rewriter.hpp>
#include <ujson/type_registry.hpp>
#include <ujson/wrapper_adapter.hpp>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace uj {
/// \brief Bit flags for mapper options.
struct MapperFlag {
	enum : std::uint8_t {
		None = 0,
		/// \brief Honour union fields (and discriminators) declared on ancestor types.
		IncludeInheritedFields = 1 << 0,
		/// \brief Write null for empty optionals / pointers instead of omitting them.
		SerializeNulls = 1 << 1,
	};
};
using MapperFlags = decltype(std::to_underlying(MapperFlag::None));

/// \brief Mapper options.
struct MapperOptions {
	MapperFlags flags{MapperFlag::None};
	/// \brief Envelope keys used when resolving union fields.
	EnvelopeKeys envelope{};
	/// \brief Options for to_text().
	SerializeOptions text{.flags = SerializeFlag::NoSpaces};
};

/// \brief Maps registered types to and from Json.
/// Per-type adapters are built (and union fields validated) on first use, then cached.
/// Thread safe once all converters have been added.
class Mapper {
  public:
	explicit Mapper(TypeRegistry const& registry, MapperOptions options = {});

	[[nodiscard]] auto registry() const -> TypeRegistry const& { return *m_registry; }
	[[nodiscard]] auto options() const -> MapperOptions const& { return m_options; }
	[[nodiscard]] auto is_set(MapperFlags const flag) const -> bool { return (m_options.flags & flag) == flag; }

	/// \brief Obtain (building if needed) the adapter for type.
	/// Throws ConfigError if type has invalid union fields.
	[[nodiscard]] auto adapter(TypeInfo const& type) const -> Adapter const&;

	/// \brief Build and validate the adapter for Type eagerly.
	/// Throws ConfigError if Type is not registered or has invalid union fields.
	template <typename Type>
	void prepare() const {
		static_cast<void>(adapter(require<Type>()));
	}

	/// \brief Use converter for all values declared as declared (owning pointer fields).
	void add_converter(TypeInfo const& declared, std::shared_ptr<Converter const> converter);

	template <typename Type>
	void add_converter(std::shared_ptr<Converter const> converter) {
		add_converter(require<Type>(), std::move(converter));
	}

	[[nodiscard]] auto find_converter(TypeInfo const& declared) const -> Converter const*;

	/// \brief Serialize value to Json.
	template <typename Type>
	[[nodiscard]] auto to_json(Type const& value) const -> std::expected<Json, Error> {
		try {
			return Codec<Type>::write(value, Context{.mapper = this});
		} catch (Error const& error) { return std::unexpected(error); }
	}

	/// \brief Deserialize Json into a new value.
	template <typename Type>
	[[nodiscard]] auto from_json(Json const& json) const -> std::expected<Type, Error> {
		try {
			auto ret = Type{};
			Codec<Type>::read(json, ret, Context{.mapper = this});
			return ret;
		} catch (Error const& error) { return std::unexpected(error); }
	}

	/// \brief Serialize value to JSON text using options().text.
	template <typename Type>
	[[nodiscard]] auto to_text(Type const& value) const -> std::expected<std::string, Error> {
		auto json = to_json(value);
		if (!json) { return std::unexpected(json.error()); }
		return json->serialize(m_options.text);
	}

	/// \brief Parse JSON text and deserialize it into a new value.
	template <typename Type>
	[[nodiscard]] auto from_text(std::string_view const text) const -> std::expected<Type, Error> {
		auto json = Json::parse(text);
		if (!json) { return std::unexpected(json.error()); }
		return from_json<Type>(*json);
	}

	// type erased operations: throw Error on failure

	/// \brief Obtain registered type.
	/// Throws Error (UnregisteredType) if not registered.
	[[nodiscard]] auto type_info(std::type_index type) const -> TypeInfo const&;
	/// \brief Write the fields of object (pointer to type) into a new object node.
	[[nodiscard]] auto write_object(TypeInfo const& type, void const* object) const -> Json;
	/// \brief Read the fields of json into object (pointer to type).
	void read_object(TypeInfo const& type, Json const& json, void* object) const;
	/// \brief Create an instance of type and read json into it.
	[[nodiscard]] auto read_new(TypeInfo const& type, Json const& json) const -> Instance;
	/// \brief Write a value held through a pointer to declared, whose most derived type is runtime.
	[[nodiscard]] auto write_polymorphic(TypeInfo const& declared, void const* object, TypeInfo const& runtime) const -> Json;
	/// \brief Read a value to be held through a pointer to declared.
	/// Converters are looked up in scoped (for field), then globally; else declared is instantiated.
	[[nodiscard]] auto read_polymorphic(TypeInfo const& declared, Json const& json, Converters const& scoped, FieldInfo const* field) const -> Instance;

  private:
	template <typename Type>
	[[nodiscard]] auto require() const -> TypeInfo const& {
		return require(typeid(Type));
	}

	[[nodiscard]] auto require(std::type_index type) const -> TypeInfo const&;
	[[nodiscard]] auto make_adapter(TypeInfo const& type) const -> std::unique_ptr<Adapter const>;

	TypeRegistry const* m_registry;
	MapperOptions m_options;
	std::shared_ptr<WrapperAdapter const> m_envelope;

	mutable std::mutex m_mutex{};
	mutable std::unordered_map<TypeInfo const*, std::unique_ptr<Adapter const>> m_adapters{};
	std::vector<std::pair<TypeInfo const*, std::shared_ptr<Converter const>>> m_converters{};
};
} // namespace uj
