#include <fixture.hpp>
#include <models.hpp>
#include <ujson/converter.hpp>
#include <ujson/wrapper_adapter.hpp>
#include <unit_test.hpp>

namespace {
using namespace uj;
using test::config_error;
using test::thrown_error;
using CfgType = ConfigError::Type;

TEST(registry_lookup) {
	auto const& registry = demo::registry();
	auto const* foo = registry.find("Foo");
	ASSERT(foo != nullptr);
	EXPECT(foo == registry.find<demo::Foo>());
	EXPECT(foo == registry.find(std::type_index{typeid(demo::Foo)}));
	EXPECT(foo->type == typeid(demo::Foo));
	EXPECT(!foo->is_abstract());
	ASSERT(foo->parent != nullptr);
	EXPECT(foo->parent->name == "Data");
	EXPECT(foo->parent->is_abstract());

	EXPECT(registry.find("Unicorn") == nullptr);
	EXPECT(registry.find<demo::Orphan>() == nullptr);
}

TEST(registry_fields) {
	auto const& registry = demo::registry();
	auto const* type = registry.find<demo::ConflictingTypesUnionObject>();
	ASSERT(type != nullptr);
	EXPECT(type->fields.size() == 2);
	EXPECT(type->find_field("type2", false) != nullptr);
	EXPECT(type->find_field("data", false) == nullptr);
	auto const* data = type->find_field("data", true);
	ASSERT(data != nullptr);
	EXPECT(data->is_union());
	ASSERT(data->content_type.has_value());
	EXPECT(*data->content_type == typeid(demo::Data));
	EXPECT(!type->find_field("type", true)->is_union());
	EXPECT(!type->find_field("type", true)->content_type.has_value());
}

TEST(registry_lineage) {
	auto const& registry = demo::registry();
	auto const* metal = registry.find<demo::Metal>();
	auto const* material = registry.find<demo::Material>();
	auto const* bar = registry.find<demo::Bar>();
	ASSERT(metal != nullptr && material != nullptr && bar != nullptr);

	auto const lineage = metal->lineage();
	ASSERT(lineage.size() == 2);
	EXPECT(lineage[0] == material);
	EXPECT(lineage[1] == metal);

	EXPECT(metal->is_a(*metal));
	EXPECT(metal->is_a(*material));
	EXPECT(!material->is_a(*metal));
	EXPECT(TypeRegistry::is_assignable(*material, *metal));
	EXPECT(!TypeRegistry::is_assignable(*material, *bar));
}

TEST(registry_cast_to) {
	auto const& registry = demo::registry();
	auto const* dog_type = registry.find<demo::Dog>();
	auto const* animal_type = registry.find<demo::Animal>();
	auto const* cat_type = registry.find<demo::Cat>();
	ASSERT(dog_type != nullptr && animal_type != nullptr && cat_type != nullptr);

	auto dog = demo::Dog{};
	void* object = &dog;
	EXPECT(dog_type->cast_to(object, *animal_type) == static_cast<demo::Animal*>(&dog));
	EXPECT(dog_type->cast_to(object, *dog_type) == object);
	EXPECT(dog_type->cast_to(object, *cat_type) == nullptr);
}

TEST(registry_duplicate_type) {
	auto registry = TypeRegistry{};
	demo::add_data_types(registry);
	EXPECT(config_error([&] { registry.add<demo::Foo, demo::Data>("OtherFoo"); }) == CfgType::DuplicateType);
	EXPECT(config_error([&] { registry.add<demo::Orphan>("Foo"); }) == CfgType::DuplicateType);
	EXPECT(config_error([&] { registry.add_enum<demo::Kind>("Kind", {}); }) == CfgType::DuplicateType);
	EXPECT(!config_error([&] { registry.add<demo::Orphan>("Orphan"); }));
	EXPECT(to_string_view(CfgType::DuplicateType) == "Duplicate type");
}

TEST(registry_unknown_parent) {
	auto registry = TypeRegistry{};
	EXPECT(config_error([&] { registry.add<demo::Dog, demo::Animal>("Dog"); }) == CfgType::UnknownParentType);
	EXPECT(registry.size() == 0);
	demo::add_animal_types(registry);
	EXPECT(registry.size() == 3);
}

TEST(registry_enum) {
	auto const& registry = demo::registry();
	auto const* info = registry.find_enum(typeid(demo::MaterialType));
	ASSERT(info != nullptr);
	EXPECT(info->name == "MaterialType");
	EXPECT(info->to_name(static_cast<std::int64_t>(demo::MaterialType::CHOCOLATE)) == "CHOCOLATE");
	EXPECT(info->to_value("METAL") == static_cast<std::int64_t>(demo::MaterialType::METAL));
	EXPECT(!info->to_name(42));
	EXPECT(!info->to_value("metal"));
	EXPECT(registry.find_enum(typeid(int)) == nullptr);
}

TEST(instance_release_as) {
	auto const& registry = demo::registry();
	auto const& foo_type = *registry.find<demo::Foo>();
	auto const& data_type = *registry.find<demo::Data>();
	auto const& animal_type = *registry.find<demo::Animal>();

	auto instance = Instance{foo_type, foo_type.create()};
	ASSERT(instance);
	EXPECT(instance.type() == &foo_type);

	auto const error = thrown_error([&] { static_cast<void>(instance.release_as(animal_type)); });
	ASSERT(error.has_value());
	EXPECT(error->type == Error::Type::TypeMismatch);
	EXPECT(instance);

	auto data = std::unique_ptr<demo::Data>{static_cast<demo::Data*>(instance.release_as(data_type))};
	EXPECT(!instance);
	ASSERT(data != nullptr);
	EXPECT(data->kind() == demo::Kind::FOO);
}

TEST(converters_scoped_to_field) {
	auto const& registry = demo::registry();
	auto const& type = *registry.find<demo::ConflictingTypesUnionObject>();
	auto const& data_type = *registry.find<demo::Data>();
	auto const* data = type.find_field("data", true);
	auto const* data2 = type.find_field("data2", true);
	ASSERT(data != nullptr && data2 != nullptr);

	auto const first = std::make_shared<WrapperAdapter>();
	auto const second = std::make_shared<WrapperAdapter>();
	auto converters = Converters{};
	EXPECT(converters.empty());
	converters.add(data_type, first, data);
	converters.add(data_type, nullptr, data2);
	EXPECT(converters.size() == 1);

	EXPECT(converters.find(data_type, data) == first.get());
	EXPECT(converters.find(data_type, data2) == nullptr);
	EXPECT(converters.find(*registry.find<demo::Material>(), data) == nullptr);

	converters.add(data_type, second);
	EXPECT(converters.find(data_type, data2) == second.get());
	EXPECT(converters.find(data_type, data) == second.get());
}
} // namespace
