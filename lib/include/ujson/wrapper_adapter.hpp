#pragma once
#include <ujson/converter.hpp>
#include <ujson/tree_rewriter.hpp>
#include <string>

namespace uj {
class TypeRegistry;

/// \brief Converter that writes and expects {type_key: tag, data_key: fields}.
/// Register with Mapper::add_converter for a base type, or let the union engine
/// install it per call.
class WrapperAdapter : public Converter {
  public:
	explicit WrapperAdapter(EnvelopeKeys keys = {}) : m_keys(std::move(keys)) {}

	[[nodiscard]] auto keys() const -> EnvelopeKeys const& { return m_keys; }

	[[nodiscard]] auto write(void const* object, TypeInfo const& runtime, Mapper const& mapper) const -> Json override;
	[[nodiscard]] auto read(Json const& json, TypeInfo const& declared, Mapper const& mapper) const -> Instance override;

	/// \brief Obtain the type tag for type. Defaults to its registered name.
	[[nodiscard]] virtual auto serialize_type(TypeInfo const& type) const -> std::string;
	/// \brief Obtain the type for a tag.
	/// Throws Error (UnknownType) if it cannot be resolved.
	[[nodiscard]] virtual auto deserialize_type(std::string_view tag, TypeRegistry const& registry) const -> TypeInfo const&;

  private:
	EnvelopeKeys m_keys;
};
} // namespace uj
