#pragma once
#include <ujson/converter.hpp>
#include <ujson/type_info.hpp>
#include <cmath>
#include <concepts>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace uj {
/// \brief Enumeration type (registered through TypeRegistry::add_enum).
template <typename Type>
concept EnumT = std::is_enum_v<Type>;

namespace detail {
// implemented by Mapper
[[nodiscard]] auto write_object(std::type_index type, void const* object, Context const& context) -> Json;
void read_object(std::type_index type, Json const& json, void* object, Context const& context);
[[nodiscard]] auto write_pointer(std::type_index declared, void const* object, std::type_index runtime, Context const& context) -> Json;
/// \returns Owning pointer to an instance of (or derived from) declared.
[[nodiscard]] auto read_pointer(std::type_index declared, Json const& json, Context const& context) -> void*;
[[nodiscard]] auto enum_to_json(std::type_index type, std::int64_t value, Context const& context) -> Json;
[[nodiscard]] auto enum_from_json(std::type_index type, Json const& json, Context const& context) -> std::int64_t;

[[noreturn]] void throw_type_mismatch(std::string_view expected, Json const& json);
[[noreturn]] void throw_invalid_number(std::string_view expected, Json const& json);
[[noreturn]] void throw_non_finite(double value);

template <NumericT Type>
[[nodiscard]] constexpr auto numeric_name() -> std::string_view {
	if constexpr (std::floating_point<Type>) {
		return sizeof(Type) == sizeof(float) ? "float" : "double";
	} else {
		constexpr auto is_signed = std::signed_integral<Type>;
		switch (sizeof(Type)) {
		case 1: return is_signed ? "int8" : "uint8";
		case 2: return is_signed ? "int16" : "uint16";
		case 4: return is_signed ? "int32" : "uint32";
		default: return is_signed ? "int64" : "uint64";
		}
	}
}

template <typename Type>
[[nodiscard]] auto most_derived(Type const& value) -> void const* {
	if constexpr (std::is_polymorphic_v<Type>) {
		return dynamic_cast<void const*>(&value);
	} else {
		return &value;
	}
}

template <typename Type>
struct Pointee {};

template <typename Type>
struct Pointee<std::unique_ptr<Type>> {
	using type = Type;
};

template <typename Type>
struct Pointee<std::shared_ptr<Type>> {
	using type = Type;
};
} // namespace detail

/// \brief Owning pointer type supported by union fields.
template <typename Type>
concept OwningPointerT = requires { typename detail::Pointee<Type>::type; };

/// \brief Obtain the pointee type of an owning pointer type, if Type is one.
template <typename Type>
[[nodiscard]] auto content_type_of() -> std::optional<std::type_index> {
	if constexpr (OwningPointerT<Type>) {
		return std::type_index{typeid(typename detail::Pointee<Type>::type)};
	} else {
		return {};
	}
}

/// \brief Converts values between C++ and Json.
/// The primary template handles registered types held by value.
/// Null Json is handled by callers: codecs are only invoked with non-null values,
/// except for nullable types (optional, owning pointers).
template <typename Type>
struct Codec {
	[[nodiscard]] static auto write(Type const& value, Context const& context) -> Json { return detail::write_object(typeid(Type), &value, context); }
	static void read(Json const& json, Type& out, Context const& context) { detail::read_object(typeid(Type), json, &out, context); }
};

template <>
struct Codec<bool> {
	[[nodiscard]] static auto write(bool const value, Context const& /*context*/) -> Json { return Json{value}; }

	static void read(Json const& json, bool& out, Context const& /*context*/) {
		if (!json.is_boolean()) { detail::throw_type_mismatch("boolean", json); }
		out = json.as_bool();
	}
};

template <NumericT Type>
struct Codec<Type> {
	[[nodiscard]] static auto write(Type const value, Context const& /*context*/) -> Json {
		if constexpr (std::floating_point<Type>) {
			if (!std::isfinite(value)) { detail::throw_non_finite(static_cast<double>(value)); }
		}
		return Json{value};
	}

	/// \brief Integers must be whole and in range, floats must be in range.
	static void read(Json const& json, Type& out, Context const& /*context*/) {
		if (!json.is_number()) { detail::throw_type_mismatch("number", json); }
		if constexpr (std::floating_point<Type>) {
			auto const value = json.as_double();
			if (std::abs(value) > static_cast<double>(std::numeric_limits<Type>::max())) {
				detail::throw_invalid_number(detail::numeric_name<Type>(), json);
			}
			out = static_cast<Type>(value);
		} else {
			auto const value = json.as_exact<Type>();
			if (!value) { detail::throw_invalid_number(detail::numeric_name<Type>(), json); }
			out = *value;
		}
	}
};

template <>
struct Codec<std::string> {
	[[nodiscard]] static auto write(std::string const& value, Context const& /*context*/) -> Json { return Json{value}; }

	static void read(Json const& json, std::string& out, Context const& /*context*/) {
		if (!json.is_string()) { detail::throw_type_mismatch("string", json); }
		out = json.as_string();
	}
};

template <EnumT Type>
struct Codec<Type> {
	[[nodiscard]] static auto write(Type const value, Context const& context) -> Json {
		return detail::enum_to_json(typeid(Type), static_cast<std::int64_t>(std::to_underlying(value)), context);
	}

	static void read(Json const& json, Type& out, Context const& context) {
		out = static_cast<Type>(detail::enum_from_json(typeid(Type), json, context));
	}
};

template <typename Type>
struct Codec<std::vector<Type>> {
	[[nodiscard]] static auto write(std::vector<Type> const& value, Context const& context) -> Json {
		auto ret = Json::empty_array();
		for (auto const& element : value) { ret.push_back(Codec<Type>::write(element, context)); }
		return ret;
	}

	static void read(Json const& json, std::vector<Type>& out, Context const& context) {
		if (!json.is_array()) { detail::throw_type_mismatch("array", json); }
		out.clear();
		out.reserve(json.as_array().size());
		for (auto const& element : json.as_array()) {
			auto value = Type{};
			if (!element.is_null()) { Codec<Type>::read(element, value, context); }
			out.push_back(std::move(value));
		}
	}
};

template <typename Type>
struct Codec<std::optional<Type>> {
	[[nodiscard]] static auto write(std::optional<Type> const& value, Context const& context) -> Json {
		if (!value) { return {}; }
		return Codec<Type>::write(*value, context);
	}

	static void read(Json const& json, std::optional<Type>& out, Context const& context) {
		if (json.is_null()) {
			out.reset();
			return;
		}
		Codec<Type>::read(json, out.emplace(), context);
	}
};

/// \brief Polymorphic: writes the runtime type, reads through converters (if any) into the declared type.
/// Deleting through Type* requires a virtual destructor when Type has subtypes.
template <typename Type>
struct Codec<std::unique_ptr<Type>> {
	[[nodiscard]] static auto write(std::unique_ptr<Type> const& value, Context const& context) -> Json {
		if (!value) { return {}; }
		return detail::write_pointer(typeid(Type), detail::most_derived(*value), typeid(*value), context);
	}

	static void read(Json const& json, std::unique_ptr<Type>& out, Context const& context) {
		if (json.is_null()) {
			out.reset();
			return;
		}
		out.reset(static_cast<Type*>(detail::read_pointer(typeid(Type), json, context)));
	}
};

template <typename Type>
struct Codec<std::shared_ptr<Type>> {
	[[nodiscard]] static auto write(std::shared_ptr<Type> const& value, Context const& context) -> Json {
		if (!value) { return {}; }
		return detail::write_pointer(typeid(Type), detail::most_derived(*value), typeid(*value), context);
	}

	static void read(Json const& json, std::shared_ptr<Type>& out, Context const& context) {
		if (json.is_null()) {
			out.reset();
			return;
		}
		out = std::shared_ptr<Type>(static_cast<Type*>(detail::read_pointer(typeid(Type), json, context)));
	}
};
} // namespace uj
