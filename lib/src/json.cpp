#include <detail/parser.hpp>
#include <detail/visitor.hpp>
#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <cmath>
#include <utility>

namespace uj {
namespace {
template <JsonType T>
using value_payload_type = std::variant_alternative_t<std::size_t(T) - 1, detail::Value::Payload>;

static_assert(std::same_as<value_payload_type<JsonType::Boolean>, detail::literal::Bool>);
static_assert(std::same_as<value_payload_type<JsonType::Number>, detail::literal::Number>);
static_assert(std::same_as<value_payload_type<JsonType::String>, detail::literal::String>);
static_assert(std::same_as<value_payload_type<JsonType::Array>, detail::Array>);
static_assert(std::same_as<value_payload_type<JsonType::Object>, detail::Object>);

template <typename T>
void append_number(std::string& out, T const value) {
	if constexpr (std::floating_point<T>) {
		// not representable in JSON
		if (!std::isfinite(value)) {
			out.append("null");
			return;
		}
	}
	auto buffer = std::array<char, 32>{};
	auto const [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
	assert(ec == std::errc{});
	out.append(buffer.data(), ptr);
}

auto const null_json_v = Json{};
auto const empty_object_v = detail::Object{};
} // namespace

struct Json::Serializer {
	explicit Serializer(SerializeOptions const& options) : m_options(options) {}

	[[nodiscard]] auto operator()(Json const& json) -> std::string {
		process(json);
		if (!m_ret.empty()) {
			// pop last comma
			m_ret.pop_back();
			if (!is_set(Flag::NoSpaces) && is_set(Flag::TrailingNewline)) { m_ret.push_back('\n'); }
		}
		return std::move(m_ret);
	}

  private:
	using Flag = SerializeFlag;

	[[nodiscard]] constexpr auto is_set(SerializeFlags const flag) const -> bool { return (m_options.flags & flag) == flag; }

	void process(Json const& json) {
		if (json.is_null()) {
			m_ret.append("null,");
			return;
		}

		auto const visitor = detail::Visitor{
			[this](detail::literal::Bool const b) { m_ret.append(b.value ? "true," : "false,"); },
			[this](detail::literal::Number const n) {
				std::visit([this](auto const value) { append_number(m_ret, value); }, n.payload);
				m_ret.push_back(',');
			},
			[this](detail::literal::String const& s) {
				append_string(s.text);
				m_ret.push_back(',');
			},
			[this](detail::Array const& a) { process_array(a); },
			[this](detail::Object const& o) { process_object(o); },
		};
		std::visit(visitor, json.m_value->payload);
	}

	void process_array(detail::Array const& array) {
		if (array.members.empty()) {
			m_ret.append("[],");
			return;
		}

		m_ret.push_back('[');
		++m_indents;
		for (auto const& json : array.members) {
			pre_next_value();
			process(json);
		}
		// pop last comma
		m_ret.pop_back();
		--m_indents;
		newline();
		m_ret.append("],");
	}

	void process_object(detail::Object const& object) {
		if (object.members.empty()) {
			m_ret.append("{},");
			return;
		}

		m_ret.push_back('{');
		++m_indents;

		if (is_set(Flag::SortKeys)) {
			// local: process_object() recurses
			auto sorted = std::vector<std::pair<std::string, Json> const*>{};
			sorted.reserve(object.members.size());
			for (auto const& entry : object.members) { sorted.push_back(&entry); }
			std::ranges::sort(sorted, {}, [](auto const* entry) -> std::string_view { return entry->first; });
			for (auto const* entry : sorted) { subprocess_object(entry->first, entry->second); }
		} else {
			for (auto const& [key, value] : object.members) { subprocess_object(key, value); }
		}

		// pop last comma
		m_ret.pop_back();
		--m_indents;
		newline();
		m_ret.append("},");
	}

	void subprocess_object(std::string_view const key, Json const& value) {
		pre_next_value();
		append_string(key);
		m_ret.push_back(':');
		space();
		process(value);
	}

	void append_string(std::string_view const text) {
		m_ret.push_back('\"');
		m_ret.append(make_escaped(text));
		m_ret.push_back('\"');
	}

	void space() {
		if (is_set(Flag::NoSpaces)) { return; }
		m_ret.push_back(' ');
	}

	void newline() {
		if (is_set(Flag::NoSpaces)) { return; }
		m_ret.append(m_options.newline);
		for (std::uint8_t i = 0; i < m_indents; ++i) { m_ret.append(m_options.indent); }
	}

	void pre_next_value() {
		if (m_ret.empty() || is_set(Flag::NoSpaces)) { return; }
		newline();
	}

	SerializeOptions const& m_options;

	std::string m_ret{};
	std::uint8_t m_indents{};
};

void Json::Deleter::operator()(detail::Value* ptr) const noexcept { std::default_delete<detail::Value>{}(ptr); }

Json::Json(Json const& other) {
	// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
	if (other.m_value) { m_value.reset(new detail::Value{*other.m_value}); }
}

auto Json::operator=(Json const& other) -> Json& {
	if (&other != this) {
		if (!other.m_value) {
			m_value.reset();
		} else {
			// copy first: other may be owned by this
			auto copy = detail::Value{*other.m_value};
			ensure_impl();
			*m_value = std::move(copy);
		}
	}
	return *this;
}

auto Json::empty_array() -> Json const& {
	static auto const ret = detail::Parser::make_json(detail::Array{});
	return ret;
}

auto Json::empty_object() -> Json const& {
	static auto const ret = detail::Parser::make_json(detail::Object{});
	return ret;
}

auto Json::get_type() const -> Type {
	if (m_value) { return Type(m_value->payload.index() + 1); }
	return Type::Null;
}

auto Json::as_bool(bool const fallback) const -> bool {
	if (!is_boolean()) { return fallback; }
	return std::get<detail::literal::Bool>(m_value->payload).value;
}

auto Json::as_double(double const fallback) const -> double {
	if (!is_number()) { return fallback; }
	return std::get<detail::literal::Number>(m_value->payload).to<double>();
}

auto Json::as_u64(std::uint64_t const fallback) const -> std::uint64_t {
	if (!is_number()) { return fallback; }
	return std::get<detail::literal::Number>(m_value->payload).to<std::uint64_t>();
}

auto Json::as_i64(std::int64_t const fallback) const -> std::int64_t {
	if (!is_number()) { return fallback; }
	return std::get<detail::literal::Number>(m_value->payload).to<std::int64_t>();
}

auto Json::to_exact_i64() const -> std::optional<std::int64_t> {
	if (!is_number()) { return {}; }
	return std::get<detail::literal::Number>(m_value->payload).to_exact<std::int64_t>();
}

auto Json::to_exact_u64() const -> std::optional<std::uint64_t> {
	if (!is_number()) { return {}; }
	return std::get<detail::literal::Number>(m_value->payload).to_exact<std::uint64_t>();
}

auto Json::as_string_view(std::string_view const fallback) const -> std::string_view {
	if (!is_string()) { return fallback; }
	return std::get<detail::literal::String>(m_value->payload).text;
}

auto Json::as_array() const -> std::span<Json const> {
	if (!is_array()) { return {}; }
	return std::get<detail::Array>(m_value->payload).members;
}

auto Json::as_object() const -> ObjectTable<Json> const& {
	if (!is_object()) { return empty_object_v.members; }
	return std::get<detail::Object>(m_value->payload).members;
}

void Json::set_null() { m_value.reset(); }

void Json::set_boolean(bool const value) {
	ensure_impl();
	m_value->payload = detail::literal::Bool{.value = value};
}

void Json::set_string(std::string_view const value) {
	ensure_impl();
	m_value->payload = detail::literal::String{.text = std::string{value}};
}

void Json::set_number(std::int64_t const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_number(std::uint64_t const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_number(double const value) {
	ensure_impl();
	m_value->payload = detail::literal::Number{.payload = value};
}

void Json::set_value(Json value) { m_value = std::move(value.m_value); }

void Json::set_array() {
	ensure_impl();
	m_value->morph<detail::Array>().members.clear();
}

void Json::set_object() {
	ensure_impl();
	m_value->morph<detail::Object>().members.clear();
}

auto Json::push_back(Json value) -> Json& {
	ensure_impl();
	return m_value->morph<detail::Array>().members.emplace_back(std::move(value));
}

auto Json::insert_or_assign(std::string key, Json value) -> Json& {
	ensure_impl();
	auto& table = m_value->morph<detail::Object>().members;
	auto const [it, _] = table.insert_or_assign(std::move(key), std::move(value));
	return it->second;
}

auto Json::find(std::string_view const key) const -> Json const* {
	if (!is_object()) { return nullptr; }
	auto const& object = std::get<detail::Object>(m_value->payload);
	auto const it = object.members.find(key);
	if (it == object.members.end()) { return nullptr; }
	return &it->second;
}

auto Json::find(std::string_view const key) -> Json* {
	if (!is_object()) { return nullptr; }
	auto& object = std::get<detail::Object>(m_value->payload);
	auto const it = object.members.find(key);
	if (it == object.members.end()) { return nullptr; }
	return &it->second;
}

auto Json::remove(std::string_view const key) -> Json {
	if (!is_object()) { return {}; }
	auto ret = std::get<detail::Object>(m_value->payload).members.extract(key);
	if (!ret) { return {}; }
	return std::move(*ret);
}

auto Json::rename_key(std::string_view const from, std::string to) -> bool {
	if (!is_object()) { return false; }
	return std::get<detail::Object>(m_value->payload).members.rename(from, std::move(to));
}

auto Json::operator[](std::string_view const key) const -> Json const& {
	if (auto const* ret = find(key)) { return *ret; }
	return null_json_v;
}

auto Json::operator[](std::string_view const key) -> Json& {
	ensure_impl();
	auto& object = m_value->morph<detail::Object>();
	auto it = object.members.find(key);
	if (it == object.members.end()) { it = object.members.insert_or_assign(std::string{key}, Json{}).first; }
	return it->second;
}

auto Json::operator[](std::size_t const index) const -> Json const& {
	if (!is_array()) { return null_json_v; }
	auto const& array = std::get<detail::Array>(m_value->payload);
	if (index >= array.members.size()) { return null_json_v; }
	return array.members.at(index);
}

auto Json::operator[](std::size_t const index) -> Json& {
	ensure_impl();
	auto& array = m_value->morph<detail::Array>();
	if (index >= array.members.size()) { array.members.resize(index + 1); }
	return array.members.at(index);
}

auto Json::serialize(SerializeOptions const& options) const -> std::string { return Serializer{options}(*this); }

auto operator==(Json const& a, Json const& b) -> bool {
	if (a.get_type() != b.get_type()) { return false; }
	if (a.is_null()) { return true; }

	auto const visitor = detail::Visitor{
		[](detail::literal::Bool const lhs, detail::literal::Bool const rhs) { return lhs.value == rhs.value; },
		[](detail::literal::Number const& lhs, detail::literal::Number const& rhs) { return lhs == rhs; },
		[](detail::literal::String const& lhs, detail::literal::String const& rhs) { return lhs.text == rhs.text; },
		[](detail::Array const& lhs, detail::Array const& rhs) { return lhs.members == rhs.members; },
		[](detail::Object const& lhs, detail::Object const& rhs) {
			if (lhs.members.size() != rhs.members.size()) { return false; }
			return std::ranges::all_of(lhs.members, [&rhs](auto const& entry) {
				auto const it = rhs.members.find(entry.first);
				return it != rhs.members.end() && it->second == entry.second;
			});
		},
		[](auto const&, auto const&) { return false; },
	};
	return std::visit(visitor, a.m_value->payload, b.m_value->payload);
}

void Json::ensure_impl() {
	if (m_value) { return; }
	// NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
	m_value.reset(new detail::Value);
}
} // namespace uj

auto uj::make_escaped(std::string_view const text) -> std::string {
	static constexpr auto hex_v = std::string_view{"0123456789abcdef"};
	auto ret = std::string{};
	ret.reserve(text.size());
	for (char const c : text) {
		switch (c) {
		case '\"': ret.append("\\\""); continue;
		case '\\': ret.append("\\\\"); continue;
		case '\b': ret.append("\\b"); continue;
		case '\f': ret.append("\\f"); continue;
		case '\t': ret.append("\\t"); continue;
		case '\n': ret.append("\\n"); continue;
		case '\r': ret.append("\\r"); continue;
		default: break;
		}
		auto const byte = static_cast<unsigned char>(c);
		if (byte < 0x20) {
			ret.append("\\u00");
			ret.push_back(hex_v[byte >> 4]);
			ret.push_back(hex_v[byte & 0xf]);
			continue;
		}
		ret.push_back(c);
	}
	return ret;
}
