#include <detail/parser.hpp>
#include <charconv>
#include <optional>

namespace uj::detail {
namespace {
[[nodiscard]] constexpr auto to_parse_error_type(ScanError::Type const type) {
	switch (type) {
	case ScanError::Type::MissingClosingQuote: return Error::Type::MissingClosingQuote;
	case ScanError::Type::UnrecognizedToken: return Error::Type::UnrecognizedToken;
	case ScanError::Type::InvalidNumber: return Error::Type::InvalidNumber;
	case ScanError::Type::InvalidCharacter: return Error::Type::InvalidCharacter;
	default: return Error::Type::Unknown;
	}
}

[[nodiscard]] auto to_parse_error(ScanError const& err) {
	return Error{
		.type = to_parse_error_type(err.type),
		.token = std::string{err.token},
		.src_loc = err.src_loc,
	};
}

template <typename T>
[[nodiscard]] auto parse_as(std::string_view const text) -> std::optional<T> {
	auto ret = T{};
	auto const* end = text.data() + text.size();
	auto const [ptr, ec] = std::from_chars(text.data(), end, ret);
	if (ec != std::errc{} || ptr != end) { return {}; }
	return ret;
}

// integers beyond 64 bits fall back to double
[[nodiscard]] auto to_number(Token const& token) -> std::optional<literal::Number> {
	auto const text = token.lexeme;
	if (token.is(TokenKind::Integer)) {
		if (text.starts_with('-')) {
			if (auto const value = parse_as<std::int64_t>(text)) { return literal::Number{.payload = *value}; }
		} else if (auto const value = parse_as<std::uint64_t>(text)) {
			return literal::Number{.payload = *value};
		}
	}
	if (auto const value = parse_as<double>(text)) { return literal::Number{.payload = *value}; }
	return {};
}

void append_utf8(std::string& out, std::uint32_t const code_point) {
	if (code_point < 0x80) {
		out.push_back(char(code_point));
	} else if (code_point < 0x800) {
		out.push_back(char(0xc0 | (code_point >> 6)));
		out.push_back(char(0x80 | (code_point & 0x3f)));
	} else if (code_point < 0x10000) {
		out.push_back(char(0xe0 | (code_point >> 12)));
		out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
		out.push_back(char(0x80 | (code_point & 0x3f)));
	} else {
		out.push_back(char(0xf0 | (code_point >> 18)));
		out.push_back(char(0x80 | ((code_point >> 12) & 0x3f)));
		out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
		out.push_back(char(0x80 | (code_point & 0x3f)));
	}
}

struct Unescape {
	[[nodiscard]] auto operator()(std::string& out) -> bool {
		auto const text = escaped;
		for (index = 0; index < text.size(); ++index) {
			char const c = text[index];
			if (c != '\\') {
				out.push_back(c);
				continue;
			}
			if (++index >= text.size()) { return false; }
			if (!unescape(out, text[index])) { return false; }
		}
		return true;
	}

	[[nodiscard]] auto unescape(std::string& out, char const escaped) -> bool {
		switch (escaped) {
		case '\"': out.push_back('\"'); return true;
		case '\\': out.push_back('\\'); return true;
		case '/': out.push_back('/'); return true;
		case 'b': out.push_back('\b'); return true;
		case 'f': out.push_back('\f'); return true;
		case 'n': out.push_back('\n'); return true;
		case 'r': out.push_back('\r'); return true;
		case 't': out.push_back('\t'); return true;
		case 'u': return unescape_unicode(out);
		default: return false;
		}
	}

	// index is at 'u'
	[[nodiscard]] auto unescape_unicode(std::string& out) -> bool {
		auto high = read_hex4();
		if (!high) { return false; }
		auto code_point = *high;
		if (code_point >= 0xd800 && code_point <= 0xdbff) {
			// surrogate pair: expect \uDC00-\uDFFF to follow
			auto const text = escaped.substr(index + 1);
			if (!text.starts_with("\\u")) { return false; }
			index += 2;
			auto const low = read_hex4();
			if (!low || *low < 0xdc00 || *low > 0xdfff) { return false; }
			code_point = 0x10000 + ((code_point - 0xd800) << 10) + (*low - 0xdc00);
		} else if (code_point >= 0xdc00 && code_point <= 0xdfff) {
			return false;
		}
		append_utf8(out, code_point);
		return true;
	}

	[[nodiscard]] auto read_hex4() -> std::optional<std::uint32_t> {
		auto const digits = escaped.substr(index + 1, 4);
		if (digits.size() < 4) { return {}; }
		auto ret = std::uint32_t{};
		auto const* end = digits.data() + digits.size();
		auto const [ptr, ec] = std::from_chars(digits.data(), end, ret, 16);
		if (ec != std::errc{} || ptr != end) { return {}; }
		index += 4;
		return ret;
	}

	std::string_view escaped{};
	std::size_t index{};
};

auto const null_json_v = uj::Json{};
} // namespace

auto Parser::make_json(Value::Payload payload) -> Json {
	auto ret = Json{};
	// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
	ret.m_value.reset(new detail::Value{.payload = std::move(payload)});
	return ret;
}

Parser::Parser(std::string_view const text) : m_scanner(text) {}

auto Parser::parse() -> Result {
	try {
		advance();
		if (m_current.is(TokenKind::Eof)) { return null_json_v; }

		auto ret = parse_value();
		if (!m_current.is(TokenKind::Eof)) { throw make_error(Error::Type::UnexpectedToken); }

		return ret;
	} catch (Error const& err) { return std::unexpected(err); }
}

void Parser::advance() {
	auto result = m_scanner.next();
	if (!result) { throw to_parse_error(result.error()); }
	m_current = *result;
}

void Parser::consume(TokenKind const expected, Error::Type const on_error) {
	if (!m_current.is(expected)) { throw make_error(on_error); }
	advance();
}

auto Parser::make_error(Error::Type const type) const -> Error {
	return Error{
		.type = type,
		.token = std::string{m_current.lexeme},
		.src_loc = m_current.src_loc,
	};
}

auto Parser::parse_value() -> Json {
	switch (m_current.kind) {
	case TokenKind::Eof: throw make_error(Error::Type::UnexpectedEof);
	case TokenKind::Null: advance(); return {};
	case TokenKind::True:
	case TokenKind::False: {
		auto ret = make_json(literal::Bool{.value = m_current.is(TokenKind::True)});
		advance();
		return ret;
	}
	case TokenKind::Integer:
	case TokenKind::Real: return make_number();
	case TokenKind::String: return make_string();
	case TokenKind::SquareLeft: return make_array();
	case TokenKind::BraceLeft: return make_object();
	default: throw make_error(Error::Type::UnexpectedToken);
	}
}

auto Parser::make_number() -> Json {
	auto number = to_number(m_current);
	if (!number) { throw make_error(Error::Type::InvalidNumber); }
	advance();
	return make_json(*number);
}

auto Parser::make_string() -> Json {
	auto ret = make_json(literal::String{.text = unescape_string()});
	advance();
	return ret;
}

auto Parser::iterate() -> bool {
	if (!m_current.is(TokenKind::Comma)) { return false; }
	// strict: more content is required after ','
	advance();
	return true;
}

auto Parser::make_array() -> Json {
	auto ret = Array{};
	advance();
	if (!m_current.is(TokenKind::SquareRight)) {
		do { ret.members.push_back(parse_value()); } while (iterate());
	}
	consume(TokenKind::SquareRight, Error::Type::MissingBracket);
	return make_json(std::move(ret));
}

auto Parser::make_object() -> Json {
	auto ret = Object{};
	advance();
	if (!m_current.is(TokenKind::BraceRight)) {
		do {
			auto key = make_key();
			consume(TokenKind::Colon, Error::Type::MissingColon);
			auto value = parse_value();
			ret.members.insert_or_assign(std::move(key), std::move(value));
		} while (iterate());
	}
	consume(TokenKind::BraceRight, Error::Type::MissingBrace);
	return make_json(std::move(ret));
}

auto Parser::unescape_string() const -> std::string {
	auto ret = std::string{};
	auto const escaped = m_current.escaped();
	ret.reserve(escaped.size());
	if (!Unescape{.escaped = escaped}(ret)) { throw make_error(Error::Type::InvalidEscape); }
	return ret;
}

auto Parser::make_key() -> std::string {
	if (!m_current.is(TokenKind::String)) { throw make_error(Error::Type::MissingKey); }
	auto ret = unescape_string();
	advance();
	return ret;
}
} // namespace uj::detail

auto uj::Json::parse(std::string_view const text) -> Result { return detail::Parser{text}.parse(); }
