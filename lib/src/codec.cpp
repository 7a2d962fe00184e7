#include <ujson/codec.hpp>
#include <array>
#include <cmath>

namespace uj {
namespace {
using namespace std::string_view_literals;

constexpr auto json_type_str_v = std::array{"null"sv, "boolean"sv, "number"sv, "string"sv, "array"sv, "object"sv};
static_assert(json_type_str_v.size() == std::size_t(JsonType::COUNT_));
} // namespace

void detail::throw_type_mismatch(std::string_view const expected, Json const& json) {
	auto token = std::string{"expected "};
	token.append(expected);
	token.append(", got ");
	token.append(json_type_str_v.at(std::size_t(json.get_type())));
	throw Error{.type = Error::Type::TypeMismatch, .token = std::move(token)};
}

void detail::throw_invalid_number(std::string_view const expected, Json const& json) {
	auto token = std::string{"expected "};
	token.append(expected);
	token.append(", got ");
	token.append(json.serialize(SerializeOptions{.flags = SerializeFlag::NoSpaces}));
	throw Error{.type = Error::Type::InvalidNumber, .token = std::move(token)};
}

void detail::throw_non_finite(double const value) {
	auto token = std::string{std::isnan(value) ? "nan" : "inf"};
	if (std::signbit(value) && !std::isnan(value)) { token.insert(0, "-"); }
	throw Error{.type = Error::Type::InvalidNumber, .token = std::move(token)};
}
} // namespace uj
