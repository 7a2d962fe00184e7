#include <fixture.hpp>
#include <models.hpp>
#include <ujson/union_field.hpp>
#include <unit_test.hpp>

namespace {
using namespace uj;
using test::config_error;
using test::config_error_message;
using CfgType = ConfigError::Type;

template <typename Type>
[[nodiscard]] auto type_of() -> TypeInfo const& {
	auto const* ret = demo::registry().find<Type>();
	ASSERT(ret != nullptr);
	return *ret;
}

template <typename Type>
auto validate(bool const include_inherited) {
	auto const& type = type_of<Type>();
	auto const fields = collect_union_fields(type, include_inherited);
	return validate_union_fields(demo::registry(), type, fields, include_inherited);
}

TEST(union_fields_collect) {
	EXPECT(collect_union_fields(type_of<demo::UnionObject>(), false).size() == 1);
	EXPECT(collect_union_fields(type_of<demo::Foo>(), true).empty());
	EXPECT(collect_union_fields(type_of<demo::InheritedUnionObject>(), false).empty());

	auto const inherited = collect_union_fields(type_of<demo::InheritedUnionObject>(), true);
	ASSERT(inherited.size() == 1);
	EXPECT(inherited[0]->name == "data");

	auto const conflicting = collect_union_fields(type_of<demo::ConflictingTypesUnionObject>(), true);
	ASSERT(conflicting.size() == 2);
	EXPECT(conflicting[0]->name == "data2");
	EXPECT(conflicting[1]->name == "data");
}

TEST(union_fields_resolve_mappings) {
	auto const specs = validate<demo::Bar>(false);
	ASSERT(specs.size() == 1);
	auto const& spec = specs[0];
	EXPECT(spec.owner == &type_of<demo::Bar>());
	EXPECT(spec.content == &type_of<demo::Material>());
	EXPECT(spec.discriminator == "barType");
	ASSERT(spec.mappings.size() == 2);

	auto const* metal = spec.find("METAL");
	ASSERT(metal != nullptr);
	EXPECT(metal->type == &type_of<demo::Metal>());
	EXPECT(spec.serialized_name(*metal) == "metal");
	EXPECT(spec.find("metal") == nullptr);
	EXPECT(spec.find("WOOD") == nullptr);
}

TEST(union_fields_default_serialized_name) {
	auto const specs = validate<demo::UnionObject>(false);
	ASSERT(specs.size() == 1);
	auto const* bar = specs[0].find("BAR");
	ASSERT(bar != nullptr);
	EXPECT(bar->serialized_name.empty());
	EXPECT(specs[0].serialized_name(*bar) == "data");
}

TEST(union_fields_inherited_discriminator) {
	auto const specs = validate<demo::ConflictingTypesUnionObject>(true);
	ASSERT(specs.size() == 2);
	EXPECT(specs[0].owner == &type_of<demo::ConflictingTypesUnionObject>());
	EXPECT(specs[1].discriminator == "type");
	EXPECT(specs[0].field != specs[1].field);
	EXPECT(specs[0].content == specs[1].content);
}

TEST(union_fields_invalid_discriminator) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::InvalidUnionDiscriminatorObject>(false)); }) == CfgType::MissingDiscriminator);
	auto const message = config_error_message([] { static_cast<void>(validate<demo::InvalidUnionDiscriminatorObject>(true)); });
	EXPECT(message.find("invalid discriminator") != std::string::npos);
	EXPECT(message.find("not_exists") != std::string::npos);
}

TEST(union_fields_invalid_mapping) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::InvalidMappingObject>(false)); }) == CfgType::IncompatibleMapping);
	auto const message = config_error_message([] { static_cast<void>(validate<demo::InvalidMappingObject>(false)); });
	EXPECT(message.find("invalid mapping type Cat") != std::string::npos);
}

TEST(union_fields_unknown_mapping) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::UnknownMappingObject>(false)); }) == CfgType::UnknownMappingType);
}

TEST(union_fields_duplicate_mapping) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::DuplicateMappingObject>(false)); }) == CfgType::DuplicateMapping);
}

TEST(union_fields_name_collision) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::ShadowingNameObject>(false)); }) == CfgType::NameCollision);
	auto const message = config_error_message([] { static_cast<void>(validate<demo::ShadowingNameObject>(false)); });
	EXPECT(message.find("serialized name 'label'") != std::string::npos);

	auto registry = TypeRegistry{};
	demo::add_data_types(registry);
	registry.add<demo::ShadowingNameObject>("ShadowingNameObject")
		.field("type", &demo::ShadowingNameObject::type)
		.union_field("data", &demo::ShadowingNameObject::data,
					 Union{.mappings = {TypeMapping{.value = "FOO", .type = "Foo", .serialized_name = "type"}}});
	auto const& type = *registry.find<demo::ShadowingNameObject>();
	auto const fields = collect_union_fields(type, false);
	auto const discriminator = [&] { static_cast<void>(validate_union_fields(registry, type, fields, false)); };
	EXPECT(config_error(discriminator) == CfgType::NameCollision);
	EXPECT(config_error_message(discriminator).find("colliding with its discriminator") != std::string::npos);
	EXPECT(to_string_view(CfgType::NameCollision) == "Name collision");
}

TEST(union_fields_unregistered_content) {
	EXPECT(config_error([] { static_cast<void>(validate<demo::OrphanUnionObject>(false)); }) == CfgType::IncompatibleMapping);
}
} // namespace
