#include <detail/reflective_adapter.hpp>
#include <detail/union_adapter.hpp>
#include <ujson/log.hpp>
#include <ujson/mapper.hpp>
#include <ujson/union_field.hpp>
#include <algorithm>
#include <ranges>

namespace uj {
namespace {
auto const empty_converters_v = Converters{};

[[nodiscard]] auto mapper_of(Context const& context) -> Mapper const& {
	if (context.mapper == nullptr) { throw Error{.type = Error::Type::Unknown, .token = "no mapper in context"}; }
	return *context.mapper;
}
} // namespace

Mapper::Mapper(TypeRegistry const& registry, MapperOptions options)
	: m_registry(&registry), m_options(std::move(options)), m_envelope(std::make_shared<WrapperAdapter>(m_options.envelope)) {}

auto Mapper::adapter(TypeInfo const& type) const -> Adapter const& {
	auto lock = std::scoped_lock{m_mutex};
	if (auto const it = m_adapters.find(&type); it != m_adapters.end()) { return *it->second; }
	auto adapter = make_adapter(type);
	auto const& ret = *adapter;
	m_adapters.emplace(&type, std::move(adapter));
	return ret;
}

void Mapper::add_converter(TypeInfo const& declared, std::shared_ptr<Converter const> converter) {
	if (!converter) { return; }
	auto lock = std::scoped_lock{m_mutex};
	auto const it = std::ranges::find(m_converters, &declared, &std::pair<TypeInfo const*, std::shared_ptr<Converter const>>::first);
	if (it != m_converters.end()) {
		it->second = std::move(converter);
		return;
	}
	m_converters.emplace_back(&declared, std::move(converter));
}

auto Mapper::find_converter(TypeInfo const& declared) const -> Converter const* {
	auto lock = std::scoped_lock{m_mutex};
	auto const it = std::ranges::find(m_converters, &declared, &std::pair<TypeInfo const*, std::shared_ptr<Converter const>>::first);
	if (it == m_converters.end()) { return nullptr; }
	return it->second.get();
}

auto Mapper::type_info(std::type_index const type) const -> TypeInfo const& {
	auto const* ret = m_registry->find(type);
	if (ret == nullptr) { throw Error{.type = Error::Type::UnregisteredType, .token = type.name()}; }
	return *ret;
}

auto Mapper::write_object(TypeInfo const& type, void const* object) const -> Json {
	auto ret = Json::empty_object();
	adapter(type).write(object, ret);
	return ret;
}

void Mapper::read_object(TypeInfo const& type, Json const& json, void* object) const { adapter(type).read(json, object, empty_converters_v); }

auto Mapper::read_new(TypeInfo const& type, Json const& json) const -> Instance {
	if (type.is_abstract()) { throw Error{.type = Error::Type::AbstractType, .token = type.name}; }
	auto ret = Instance{type, type.create()};
	if (!json.is_null()) { read_object(type, json, ret.get()); }
	return ret;
}

auto Mapper::write_polymorphic(TypeInfo const& declared, void const* object, TypeInfo const& runtime) const -> Json {
	if (auto const* converter = find_converter(declared)) { return converter->write(object, runtime, *this); }
	return write_object(runtime, object);
}

auto Mapper::read_polymorphic(TypeInfo const& declared, Json const& json, Converters const& scoped, FieldInfo const* field) const -> Instance {
	if (auto const* converter = scoped.find(declared, field)) { return converter->read(json, declared, *this); }
	if (auto const* converter = find_converter(declared)) { return converter->read(json, declared, *this); }
	return read_new(declared, json);
}

auto Mapper::require(std::type_index const type) const -> TypeInfo const& {
	auto const* ret = m_registry->find(type);
	if (ret == nullptr) {
		auto const message = std::string{"type "} + type.name() + " is not registered";
		g_log.error(message);
		throw ConfigError{ConfigError::Type::UnregisteredType, message};
	}
	return *ret;
}

auto Mapper::make_adapter(TypeInfo const& type) const -> std::unique_ptr<Adapter const> {
	auto const include_inherited = is_set(MapperFlag::IncludeInheritedFields);
	auto delegate = std::make_unique<detail::ReflectiveAdapter>(*this, type);
	auto const fields = collect_union_fields(type, include_inherited);
	if (fields.empty()) { return delegate; }

	auto specs = validate_union_fields(*m_registry, type, fields, include_inherited);
	g_log.debug("built union adapter for " + type.name);
	return std::make_unique<detail::UnionAdapter>(std::move(specs), std::move(delegate), m_envelope);
}
} // namespace uj

// codec hooks

auto uj::detail::write_object(std::type_index const type, void const* object, Context const& context) -> Json {
	auto const& mapper = mapper_of(context);
	return mapper.write_object(mapper.type_info(type), object);
}

void uj::detail::read_object(std::type_index const type, Json const& json, void* object, Context const& context) {
	auto const& mapper = mapper_of(context);
	mapper.read_object(mapper.type_info(type), json, object);
}

auto uj::detail::write_pointer(std::type_index const declared, void const* object, std::type_index const runtime, Context const& context) -> Json {
	auto const& mapper = mapper_of(context);
	return mapper.write_polymorphic(mapper.type_info(declared), object, mapper.type_info(runtime));
}

auto uj::detail::read_pointer(std::type_index const declared, Json const& json, Context const& context) -> void* {
	auto const& mapper = mapper_of(context);
	auto const& type = mapper.type_info(declared);
	auto const& scoped = context.converters != nullptr ? *context.converters : empty_converters_v;
	auto instance = mapper.read_polymorphic(type, json, scoped, context.field);
	return instance.release_as(type);
}

auto uj::detail::enum_to_json(std::type_index const type, std::int64_t const value, Context const& context) -> Json {
	auto const* info = mapper_of(context).registry().find_enum(type);
	if (info == nullptr) { throw Error{.type = Error::Type::UnregisteredType, .token = type.name()}; }
	auto const name = info->to_name(value);
	if (!name) { throw Error{.type = Error::Type::InvalidEnum, .token = info->name + "(" + std::to_string(value) + ")"}; }
	return Json{*name};
}

auto uj::detail::enum_from_json(std::type_index const type, Json const& json, Context const& context) -> std::int64_t {
	auto const* info = mapper_of(context).registry().find_enum(type);
	if (info == nullptr) { throw Error{.type = Error::Type::UnregisteredType, .token = type.name()}; }
	if (!json.is_string()) { throw_type_mismatch("string", json); }
	auto const ret = info->to_value(json.as_string_view());
	if (!ret) { throw Error{.type = Error::Type::InvalidEnum, .token = json.as_string()}; }
	return *ret;
}
