#include <ujson/log.hpp>
#include <array>
#include <iostream>
#include <mutex>

namespace uj {
namespace {
using namespace std::string_view_literals;

constexpr auto log_level_str_v = std::array{"Debug"sv, "Info"sv, "Warn"sv, "Error"sv};
static_assert(log_level_str_v.size() == std::size_t(LogLevel::COUNT_));

std::mutex g_mutex;
log_sink_t g_sink = &Logger::default_sink;
LogLevel g_level{LogLevel::Warn};
} // namespace

auto to_string_view(LogLevel const level) -> std::string_view {
	if (int(level) < 0 || level >= LogLevel::COUNT_) { return "Unknown"; }
	return log_level_str_v.at(std::size_t(level));
}

void Logger::default_sink(LogLevel const level, std::string_view const message) {
	auto& stream = output == output_t::std_out ? std::cout : std::cerr;
	stream << "[ujson] " << to_string_view(level) << ": " << message << std::endl;
}

void Logger::set_sink(log_sink_t sink) const {
	std::scoped_lock<std::mutex> lock(g_mutex);
	g_sink = sink;
}

void Logger::set_level(LogLevel const level) const {
	std::scoped_lock<std::mutex> lock(g_mutex);
	g_level = level;
}

auto Logger::get_level() const -> LogLevel {
	std::scoped_lock<std::mutex> lock(g_mutex);
	return g_level;
}

void Logger::operator()(LogLevel const level, std::string_view const message) const {
	std::scoped_lock<std::mutex> lock(g_mutex);
	if (level < g_level || !g_sink) { return; }
	g_sink(level, message);
}
} // namespace uj
