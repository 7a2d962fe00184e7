#pragma once
#include <ujson/json.hpp>
#include <string>
#include <string_view>

namespace uj {
/// \brief Keys of an envelope node: {type_key: tag, data_key: content}.
struct EnvelopeKeys {
	std::string type_key{"type"};
	std::string data_key{"data"};
};

/// \brief Build an envelope node.
[[nodiscard]] auto make_envelope(std::string_view type_tag, Json data, EnvelopeKeys const& keys = {}) -> Json;

/// \brief Rename the union slot field_name to serialized_name, keeping its position.
/// No-op if the names are equal or object has no field_name.
void flatten(Json& object, std::string_view field_name, std::string_view serialized_name);

/// \brief Move the value under serialized_name into an envelope stored under field_name.
/// The slot keeps its position. No-op if object has no serialized_name.
void wrap(Json& object, std::string_view field_name, std::string_view serialized_name, std::string_view type_tag, EnvelopeKeys const& keys = {});
} // namespace uj
