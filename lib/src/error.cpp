#include <ujson/error.hpp>
#include <array>
#include <string_view>

namespace uj {
namespace {
using namespace std::string_view_literals;

constexpr auto error_type_str_v = std::array{
	"Unknown error"sv,
	"Unrecognized Token"sv,
	"Missing closing quote"sv,
	"Invalid number"sv,
	"Invalid escape"sv,
	"Invalid character"sv,
	"Unexpected token"sv,
	"Unexpected end of file"sv,
	"Missing key"sv,
	"Missing colon (':')"sv,
	"Missing closing brace ('}')"sv,
	"Missing closing square bracket (']')"sv,
	"Type mismatch"sv,
	"Missing discriminator"sv,
	"Invalid discriminator"sv,
	"Unknown type"sv,
	"Abstract type"sv,
	"Unregistered type"sv,
	"Invalid enum"sv,
	"Invalid envelope"sv,
};

static_assert(error_type_str_v.size() == std::size_t(Error::Type::COUNT_));

constexpr auto config_error_type_str_v = std::array{
	"Missing discriminator"sv,
	"Incompatible mapping"sv,
	"Unknown mapping type"sv,
	"Duplicate mapping"sv,
	"Duplicate type"sv,
	"Unknown parent type"sv,
	"Unregistered type"sv,
	"Name collision"sv,
};

static_assert(config_error_type_str_v.size() == std::size_t(ConfigError::Type::COUNT_));
} // namespace
} // namespace uj

auto uj::to_string_view(Error::Type const type) -> std::string_view {
	if (int(type) < 0 || type >= Error::Type::COUNT_) { return uj::error_type_str_v[std::size_t(Error::Type::Unknown)]; }
	return uj::error_type_str_v.at(std::size_t(type));
}

auto uj::to_string(Error const& error) -> std::string {
	auto ret = std::string{to_string_view(error.type)};
	if (!error.token.empty()) {
		ret.append(" - '");
		ret.append(error.token);
		ret.push_back('\'');
	}
	auto const src_loc = error.src_loc;
	if (src_loc.line > 0 && src_loc.column > 0) {
		ret.append(" [");
		ret.append(std::to_string(src_loc.line));
		ret.push_back(':');
		ret.append(std::to_string(src_loc.column));
		ret.push_back(']');
	}
	return ret;
}

auto uj::to_string_view(ConfigError::Type const type) -> std::string_view {
	if (int(type) < 0 || type >= ConfigError::Type::COUNT_) { return "Unknown"; }
	return uj::config_error_type_str_v.at(std::size_t(type));
}
