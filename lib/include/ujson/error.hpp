#pragma once
#include <ujson/src_loc.hpp>
#include <stdexcept>
#include <string_view>
#include <string>

namespace uj {
/// \brief Various kinds of parse and mapping errors.
/// Contains contextual token, and source location if parse error.
struct Error {
	enum class Type : std::int8_t {
		Unknown,
		UnrecognizedToken,
		MissingClosingQuote,
		InvalidNumber,
		InvalidEscape,
		InvalidCharacter,
		UnexpectedToken,
		UnexpectedEof,
		MissingKey,
		MissingColon,
		MissingBrace,
		MissingBracket,
		TypeMismatch,
		MissingDiscriminator,
		InvalidDiscriminator,
		UnknownType,
		AbstractType,
		UnregisteredType,
		InvalidEnum,
		InvalidEnvelope,
		COUNT_,
	};

	Type type{Type::Unknown};
	std::string token{};
	SrcLoc src_loc{};
};

/// \brief Obtain stringified Error Type.
auto to_string_view(Error::Type type) -> std::string_view;

/// \brief Obtain print-friendly error string.
auto to_string(Error const& error) -> std::string;

/// \brief Thrown when a type or union field is set up incorrectly.
/// Raised eagerly (registration, adapter creation), never per call.
struct ConfigError : std::runtime_error {
	enum class Type : std::int8_t {
		MissingDiscriminator,
		IncompatibleMapping,
		UnknownMappingType,
		DuplicateMapping,
		DuplicateType,
		UnknownParentType,
		UnregisteredType,
		NameCollision,
		COUNT_,
	};

	explicit ConfigError(Type type, std::string const& message) : std::runtime_error(message), type(type) {}

	Type type{};
};

/// \brief Obtain stringified ConfigError Type.
auto to_string_view(ConfigError::Type type) -> std::string_view;
} // namespace uj
