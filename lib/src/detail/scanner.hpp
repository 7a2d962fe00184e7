#pragma once
#include <detail/token.hpp>
#include <expected>
#include <optional>

namespace uj::detail {
struct ScanError {
	enum class Type : std::int8_t {
		UnrecognizedToken,
		MissingClosingQuote,
		InvalidNumber,
		InvalidCharacter,
	};

	Type type{};
	std::string_view token{};
	SrcLoc src_loc{};
};

namespace scan {
[[nodiscard]] constexpr auto is_space(char const c) -> bool { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
[[nodiscard]] constexpr auto is_digit(char const c) -> bool { return c >= '0' && c <= '9'; }
// keywords are lowercase
[[nodiscard]] constexpr auto is_word(char const c) -> bool { return c >= 'a' && c <= 'z'; }
[[nodiscard]] constexpr auto is_number_part(char const c) -> bool { return is_digit(c) || c == '.' || c == 'e' || c == 'E' || c == '-' || c == '+'; }
[[nodiscard]] constexpr auto is_control(char const c) -> bool { return static_cast<unsigned char>(c) < 0x20; }

[[nodiscard]] constexpr auto to_punctuation(char const c) -> std::optional<TokenKind> {
	switch (c) {
	case ':': return TokenKind::Colon;
	case ',': return TokenKind::Comma;
	case '{': return TokenKind::BraceLeft;
	case '}': return TokenKind::BraceRight;
	case '[': return TokenKind::SquareLeft;
	case ']': return TokenKind::SquareRight;
	default: return {};
	}
}

[[nodiscard]] constexpr auto to_keyword(std::string_view const word) -> std::optional<TokenKind> {
	if (word == "null") { return TokenKind::Null; }
	if (word == "true") { return TokenKind::True; }
	if (word == "false") { return TokenKind::False; }
	return {};
}

[[nodiscard]] constexpr auto count_digits(std::string_view const text) -> std::size_t {
	auto ret = std::size_t{};
	while (ret < text.size() && is_digit(text[ret])) { ++ret; }
	return ret;
}

/// \brief Match the whole of text against -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
/// \returns Integer or Real, nullopt if text is not a JSON number.
[[nodiscard]] constexpr auto classify_number(std::string_view text) -> std::optional<TokenKind> {
	if (text.starts_with('-')) { text.remove_prefix(1); }
	auto digits = count_digits(text);
	if (digits == 0 || (digits > 1 && text.front() == '0')) { return {}; }
	text.remove_prefix(digits);

	auto ret = TokenKind::Integer;
	if (text.starts_with('.')) {
		text.remove_prefix(1);
		digits = count_digits(text);
		if (digits == 0) { return {}; }
		text.remove_prefix(digits);
		ret = TokenKind::Real;
	}
	if (text.starts_with('e') || text.starts_with('E')) {
		text.remove_prefix(1);
		if (text.starts_with('+') || text.starts_with('-')) { text.remove_prefix(1); }
		digits = count_digits(text);
		if (digits == 0) { return {}; }
		text.remove_prefix(digits);
		ret = TokenKind::Real;
	}
	if (!text.empty()) { return {}; }
	return ret;
}
} // namespace scan

/// \brief Strict RFC 8259 lexer over a borrowed string.
class Scanner {
  public:
	using Result = std::expected<Token, ScanError>;

	explicit constexpr Scanner(std::string_view const text) : m_remain(text) {
		if (!m_remain.empty()) { m_src_loc = {.line = 1, .column = 1}; }
		skip_space();
	}

	[[nodiscard]] constexpr auto next() -> Result {
		if (m_remain.empty()) { return Token{.src_loc = m_src_loc}; }

		auto const front = m_remain.front();
		if (auto const kind = scan::to_punctuation(front)) { return take(*kind, 1); }
		if (front == '"') { return scan_string(); }
		if (front == '-' || scan::is_digit(front)) { return scan_number(); }
		if (scan::is_word(front)) { return scan_keyword(); }

		return fail(ScanError::Type::UnrecognizedToken, 1);
	}

  private:
	constexpr void advance(std::size_t count) {
		for (; count > 0 && !m_remain.empty(); --count) {
			if (m_remain.front() == '\n') {
				++m_src_loc.line;
				m_src_loc.column = 1;
			} else {
				++m_src_loc.column;
			}
			m_remain.remove_prefix(1);
		}
	}

	constexpr void skip_space() {
		while (!m_remain.empty() && scan::is_space(m_remain.front())) { advance(1); }
	}

	[[nodiscard]] constexpr auto take(TokenKind const kind, std::size_t const length) -> Token {
		auto const ret = Token{.kind = kind, .lexeme = m_remain.substr(0, length), .src_loc = m_src_loc};
		advance(length);
		skip_space();
		return ret;
	}

	[[nodiscard]] constexpr auto fail(ScanError::Type const type, std::size_t const length) const -> Result {
		return std::unexpected(ScanError{.type = type, .token = m_remain.substr(0, length), .src_loc = m_src_loc});
	}

	template <typename Pred>
	[[nodiscard]] constexpr auto run_length(Pred const pred) const -> std::size_t {
		auto ret = std::size_t{};
		while (ret < m_remain.size() && pred(m_remain[ret])) { ++ret; }
		return ret;
	}

	[[nodiscard]] constexpr auto scan_number() -> Result {
		auto const length = run_length(&scan::is_number_part);
		auto const kind = scan::classify_number(m_remain.substr(0, length));
		if (!kind) { return fail(ScanError::Type::InvalidNumber, length); }
		return take(*kind, length);
	}

	[[nodiscard]] constexpr auto scan_keyword() -> Result {
		auto const length = run_length(&scan::is_word);
		auto const kind = scan::to_keyword(m_remain.substr(0, length));
		if (!kind) { return fail(ScanError::Type::UnrecognizedToken, length); }
		return take(*kind, length);
	}

	// escape sequences are validated when the parser unescapes the token
	[[nodiscard]] constexpr auto scan_string() -> Result {
		for (auto index = std::size_t{1}; index < m_remain.size(); ++index) {
			auto const c = m_remain[index];
			if (scan::is_control(c)) { return fail(ScanError::Type::InvalidCharacter, index + 1); }
			if (c == '"') { return take(TokenKind::String, index + 1); }
			if (c == '\\') { ++index; }
		}
		return fail(ScanError::Type::MissingClosingQuote, 1);
	}

	std::string_view m_remain{};
	SrcLoc m_src_loc{};
};
} // namespace uj::detail
