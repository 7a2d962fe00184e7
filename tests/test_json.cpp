#include <ujson/json.hpp>
#include <unit_test.hpp>
#include <limits>
#include <utility>

namespace {
TEST(json_input) {
	constexpr auto text = R"({
  "elements": [-2.5e3, "bar"],
  "foo": "party",
  "universe": 42
})";
	auto result = uj::Json::parse(text);
	ASSERT(result);
	auto& json = result.value();
	EXPECT(!json.is_null());

	auto const& elements = json["elements"];
	auto const& foo = json["foo"];
	auto const& universe = json["universe"];
	EXPECT(std::as_const(json)["nonexistent"].is_null());
	EXPECT(!json.contains("nonexistent"));

	auto const& elem0 = elements[0];
	auto const& elem1 = elements[1];
	EXPECT(elements[2].is_null());

	EXPECT(elements.get_type() == uj::JsonType::Array);
	EXPECT(elem0.get_type() == uj::JsonType::Number);
	EXPECT(elem1.is_string());
	EXPECT(foo.is_string());
	EXPECT(universe.is_number());

	EXPECT(elem0.as_double() == -2500.0);
	EXPECT(elem1.as_string_view() == "bar");
	EXPECT(foo.as_string_view() == "party");
	EXPECT(universe.as<int>() == 42);
}

TEST(json_output) {
	auto json = uj::Json{};
	EXPECT(json.is_null());
	json.set_boolean(true);
	EXPECT(json.as_bool());
	json.set_number(42);
	EXPECT(json.as<int>() == 42);
	json.set_string("meow");
	EXPECT(json.as_string_view() == "meow");
	json.set_object();
	EXPECT(json.is_object());
	EXPECT(json.as_object().empty());
	json.set_value(uj::Json::empty_array());
	EXPECT(json.is_array());
	EXPECT(json.as_array().empty());
	json.set_value(uj::Json{true});
	EXPECT(json.as_bool());
}

TEST(json_exact_integers) {
	auto json = uj::Json{300};
	EXPECT(json.as_exact<int>() == 300);
	EXPECT(!json.as_exact<std::uint8_t>());
	EXPECT(json.as_exact<std::uint16_t>() == 300);

	json = uj::Json{-1};
	EXPECT(json.as_exact<std::int8_t>() == -1);
	EXPECT(!json.as_exact<unsigned>());

	json = uj::Json{2.0};
	EXPECT(json.as_exact<long>() == 2);
	json = uj::Json{2.5};
	EXPECT(!json.as_exact<long>());
	EXPECT(json.as_i64() == 2);

	json = uj::Json{1e300};
	EXPECT(!json.to_exact_i64());
	EXPECT(json.as_i64() == std::numeric_limits<std::int64_t>::max());
	EXPECT(json.as_u64() == std::numeric_limits<std::uint64_t>::max());
	EXPECT(uj::Json{-1e300}.as_i64() == std::numeric_limits<std::int64_t>::min());

	EXPECT(!uj::Json{"1"}.as_exact<int>());
}

TEST(json_non_finite_output) {
	auto json = uj::Json::empty_array();
	json.push_back(std::numeric_limits<double>::quiet_NaN());
	json.push_back(std::numeric_limits<double>::infinity());
	json.push_back(0.25);
	auto const text = to_string(json, {.flags = uj::SerializeFlag::NoSpaces});
	EXPECT(text == "[null,null,0.25]");
	EXPECT(uj::Json::parse(text).has_value());
}

TEST(json_string_unescaped) {
	auto json = uj::Json{"say \"hi\"\n"};
	EXPECT(json.as_string_view() == "say \"hi\"\n");
	EXPECT(json.serialize(uj::SerializeOptions{.flags = uj::SerializeFlag::NoSpaces}) == R"("say \"hi\"\n")");
}

TEST(json_find) {
	auto json = uj::Json::parse(R"({"type": "FOO", "data": {"value": 1}})").value();
	auto const* type = std::as_const(json).find("type");
	ASSERT(type != nullptr);
	EXPECT(type->as_string_view() == "FOO");
	EXPECT(json.find("missing") == nullptr);

	auto* data = json.find("data");
	ASSERT(data != nullptr);
	data->insert_or_assign("value", 2);
	EXPECT(json["data"]["value"].as<int>() == 2);

	auto const scalar = uj::Json{42};
	EXPECT(scalar.find("type") == nullptr);
}

TEST(json_remove) {
	auto json = uj::Json::parse(R"({"a": 1, "b": [true], "c": 3})").value();
	auto removed = json.remove("b");
	EXPECT(removed.is_array());
	EXPECT(removed[0].as_bool());
	EXPECT(!json.contains("b"));
	EXPECT(json.as_object().size() == 2);

	EXPECT(json.remove("b").is_null());
	auto scalar = uj::Json{"x"};
	EXPECT(scalar.remove("x").is_null());
	EXPECT(scalar.is_string());
}

TEST(json_rename_key) {
	auto json = uj::Json::parse(R"({"type": "BAR", "data": {"x": 1}, "tail": 0})").value();
	EXPECT(json.rename_key("data", "metal"));
	EXPECT(!json.contains("data"));
	EXPECT(json["metal"]["x"].as<int>() == 1);

	// position is kept
	auto it = json.as_object().begin();
	EXPECT((it++)->first == "type");
	EXPECT((it++)->first == "metal");
	EXPECT(it->first == "tail");

	EXPECT(!json.rename_key("missing", "other"));
	EXPECT(json.rename_key("metal", "metal"));

	// existing target is replaced
	EXPECT(json.rename_key("tail", "type"));
	EXPECT(json.as_object().size() == 2);
	EXPECT(json["type"].as<int>() == 0);
}

TEST(json_insertion_order) {
	auto json = uj::Json{};
	json.insert_or_assign("z", 1);
	json.insert_or_assign("a", 2);
	json.insert_or_assign("z", 3);
	EXPECT(json.serialize(uj::SerializeOptions{.flags = uj::SerializeFlag::NoSpaces}) == R"({"z":3,"a":2})");
}

TEST(json_equality) {
	auto const a = uj::Json::parse(R"({"x": 1, "y": [1.5, "s", null, false], "z": {}})").value();
	auto const b = uj::Json::parse(R"({"z": {}, "y": [1.5, "s", null, false], "x": 1})").value();
	EXPECT(a == b);

	auto c = b;
	c["y"][2] = uj::Json{0};
	EXPECT(a != c);

	EXPECT(uj::Json::parse("1").value() == uj::Json::parse("1.0").value());
	EXPECT(uj::Json::parse("-1").value() != uj::Json::parse("18446744073709551615").value());
	EXPECT(uj::Json{} == uj::Json{nullptr});
	EXPECT(uj::Json{"1"} != uj::Json{1});
	EXPECT(uj::Json::parse("[1, 2]").value() != uj::Json::parse("[2, 1]").value());
}

TEST(json_copy) {
	auto json = uj::Json::parse(R"({"inner": {"v": 1}})").value();
	auto copy = json;
	copy["inner"]["v"] = uj::Json{2};
	EXPECT(json["inner"]["v"].as<int>() == 1);

	// assigning a member of this to this
	json = json["inner"];
	EXPECT(json["v"].as<int>() == 1);
}
} // namespace
