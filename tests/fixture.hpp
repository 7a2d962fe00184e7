#pragma once
#include <ujson/error.hpp>
#include <optional>
#include <string>

namespace uj::test {
/// \brief Invoke func and obtain the type of the ConfigError it throws, if any.
template <typename Func>
[[nodiscard]] auto config_error(Func func) -> std::optional<ConfigError::Type> {
	try {
		func();
	} catch (ConfigError const& e) { return e.type; }
	return {};
}

/// \brief Invoke func and obtain the message of the ConfigError it throws, if any.
template <typename Func>
[[nodiscard]] auto config_error_message(Func func) -> std::string {
	try {
		func();
	} catch (ConfigError const& e) { return e.what(); }
	return {};
}

/// \brief Invoke func and obtain the Error it throws, if any.
template <typename Func>
[[nodiscard]] auto thrown_error(Func func) -> std::optional<Error> {
	try {
		func();
	} catch (Error const& e) { return e; }
	return {};
}
} // namespace uj::test
