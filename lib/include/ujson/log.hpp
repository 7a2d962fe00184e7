#pragma once
#include <cstdint>
#include <string_view>

#if !defined(UJSON_LOG_OUTPUT)
#define UJSON_LOG_OUTPUT 0
#endif

namespace uj {
enum class LogLevel : std::int8_t { Debug, Info, Warn, Error, COUNT_ };

/// \brief Obtain stringified LogLevel.
auto to_string_view(LogLevel level) -> std::string_view;

///
/// \brief Log sink callback
///
using log_sink_t = void (*)(LogLevel, std::string_view);

///
/// \brief Process-wide logger; thread safe
///
struct Logger {
	enum class output_t { std_err, std_out };

	static constexpr output_t output = static_cast<output_t>(UJSON_LOG_OUTPUT);

	static void default_sink(LogLevel level, std::string_view message);

	/// \brief Forward message to sink if level is at or above the threshold.
	void operator()(LogLevel level, std::string_view message) const;
	/// \brief Replace the sink; nullptr disables output.
	void set_sink(log_sink_t sink) const;
	/// \brief Set the minimum level forwarded to the sink.
	void set_level(LogLevel level) const;
	[[nodiscard]] auto get_level() const -> LogLevel;

	void debug(std::string_view const message) const { (*this)(LogLevel::Debug, message); }
	void info(std::string_view const message) const { (*this)(LogLevel::Info, message); }
	void warn(std::string_view const message) const { (*this)(LogLevel::Warn, message); }
	void error(std::string_view const message) const { (*this)(LogLevel::Error, message); }
};

inline Logger const g_log{};
} // namespace uj
