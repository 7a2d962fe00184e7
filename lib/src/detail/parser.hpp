#pragma once
#include <detail/scanner.hpp>
#include <detail/value.hpp>
#include <ujson/json.hpp>

namespace uj::detail {
class Parser {
  public:
	[[nodiscard]] static auto make_json(Value::Payload payload) -> Json;

	explicit Parser(std::string_view text);

	[[nodiscard]] auto parse() -> Result;

  private:
	void advance();
	void consume(TokenKind expected, Error::Type on_error);

	[[nodiscard]] auto make_error(Error::Type type) const -> Error;

	[[nodiscard]] auto parse_value() -> Json;
	[[nodiscard]] auto make_number() -> Json;
	[[nodiscard]] auto make_string() -> Json;

	[[nodiscard]] auto iterate() -> bool;
	[[nodiscard]] auto make_array() -> Json;
	[[nodiscard]] auto make_object() -> Json;

	[[nodiscard]] auto unescape_string() const -> std::string;
	[[nodiscard]] auto make_key() -> std::string;

	Scanner m_scanner;
	Token m_current{};
};
} // namespace uj::detail
