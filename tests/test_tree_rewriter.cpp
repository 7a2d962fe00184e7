#include <ujson/tree_rewriter.hpp>
#include <unit_test.hpp>

namespace {
using namespace uj;

[[nodiscard]] auto parse(std::string_view const text) -> Json {
	auto ret = Json::parse(text);
	ASSERT(ret);
	return std::move(*ret);
}

[[nodiscard]] auto keys_of(Json const& json) -> std::string {
	auto ret = std::string{};
	for (auto const& [key, value] : json.as_object()) {
		ret += key;
		ret += ',';
	}
	return ret;
}

TEST(rewriter_make_envelope) {
	auto const envelope = make_envelope("Foo", parse(R"({"value": "x"})"));
	EXPECT(keys_of(envelope) == "type,data,");
	EXPECT(envelope["type"].as_string_view() == "Foo");
	EXPECT(envelope["data"]["value"].as_string_view() == "x");

	auto const custom = make_envelope("Cat", Json{}, EnvelopeKeys{.type_key = "@class", .data_key = "@value"});
	EXPECT(keys_of(custom) == "@class,@value,");
	EXPECT(custom["@value"].is_null());
}

TEST(rewriter_flatten) {
	auto json = parse(R"({"barType": "METAL", "data": {"material": "iron"}, "weight": 3})");
	flatten(json, "data", "metal");
	EXPECT(keys_of(json) == "barType,metal,weight,");
	EXPECT(json["metal"]["material"].as_string_view() == "iron");

	flatten(json, "metal", "metal");
	EXPECT(keys_of(json) == "barType,metal,weight,");

	flatten(json, "absent", "other");
	EXPECT(keys_of(json) == "barType,metal,weight,");
}

TEST(rewriter_wrap) {
	auto json = parse(R"({"barType": "METAL", "metal": {"material": "iron"}, "weight": 3})");
	wrap(json, "data", "metal", "Metal");
	EXPECT(keys_of(json) == "barType,data,weight,");
	EXPECT(json["data"] == parse(R"({"type": "Metal", "data": {"material": "iron"}})"));

	// same name: wrapped in place
	json = parse(R"({"type": "FOO", "data": {"value": "x"}})");
	wrap(json, "data", "data", "Foo", EnvelopeKeys{.type_key = "t", .data_key = "d"});
	EXPECT(json == parse(R"({"type": "FOO", "data": {"t": "Foo", "d": {"value": "x"}}})"));
}

TEST(rewriter_wrap_absent) {
	auto json = parse(R"({"barType": "METAL"})");
	auto const expected = json;
	wrap(json, "data", "metal", "Metal");
	EXPECT(json == expected);
}

TEST(rewriter_wrap_replaces_stale_slot) {
	auto json = parse(R"({"data": 1, "metal": {"material": "gold"}})");
	wrap(json, "data", "metal", "Metal");
	EXPECT(json.as_object().size() == 1);
	EXPECT(json["data"]["data"]["material"].as_string_view() == "gold");
}
} // namespace
