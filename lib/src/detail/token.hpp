#pragma once
#include <ujson/src_loc.hpp>
#include <cstdint>
#include <string_view>

namespace uj::detail {
/// \brief Lexical category of a Token.
enum class TokenKind : std::int8_t {
	Eof,
	Null,
	True,
	False,
	Colon,
	Comma,
	BraceLeft,
	BraceRight,
	SquareLeft,
	SquareRight,
	// no fraction or exponent
	Integer,
	Real,
	String,
};

struct Token {
	[[nodiscard]] constexpr auto is(TokenKind const k) const -> bool { return kind == k; }

	/// \brief Text between the quotes of a String token, escapes intact.
	[[nodiscard]] constexpr auto escaped() const -> std::string_view {
		if (kind != TokenKind::String || lexeme.size() < 2) { return {}; }
		return lexeme.substr(1, lexeme.size() - 2);
	}

	TokenKind kind{TokenKind::Eof};
	/// \brief Source text, including quotes for strings.
	std::string_view lexeme{};
	SrcLoc src_loc{};
};
} // namespace uj::detail
