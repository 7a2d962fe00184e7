#pragma once
#include <ujson/json.hpp>
#include <ujson/object_table.hpp>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace uj::detail {
namespace literal {
struct Bool {
	bool value{};
};

/// \brief Parsed integers are stored as u64 unless negative.
/// Fractions, exponents and integers beyond 64 bits are stored as double.
struct Number {
	using Payload = std::variant<double, std::uint64_t, std::int64_t>;

	/// \brief Convert to T. Out of range doubles saturate to the bounds of integral T.
	template <typename T>
	[[nodiscard]] auto to() const -> T {
		auto const visitor = [](auto const n) -> T {
			if constexpr (std::integral<T> && std::floating_point<decltype(n)>) {
				if (std::isnan(n)) { return T{}; }
				if (n >= upper_bound<T>()) { return std::numeric_limits<T>::max(); }
				if (n < static_cast<double>(std::numeric_limits<T>::min())) { return std::numeric_limits<T>::min(); }
			}
			return static_cast<T>(n);
		};
		return std::visit(visitor, payload);
	}

	/// \brief Convert to T without loss.
	/// \returns nullopt if fractional or out of range of T.
	template <std::integral T>
	[[nodiscard]] auto to_exact() const -> std::optional<T> {
		auto const visitor = [](auto const n) -> std::optional<T> {
			if constexpr (std::floating_point<decltype(n)>) {
				if (!std::isfinite(n) || std::trunc(n) != n) { return {}; }
				if (n >= upper_bound<T>() || n < static_cast<double>(std::numeric_limits<T>::min())) { return {}; }
			} else {
				if (!std::in_range<T>(n)) { return {}; }
			}
			return static_cast<T>(n);
		};
		return std::visit(visitor, payload);
	}

	[[nodiscard]] auto operator==(Number const& rhs) const -> bool {
		auto const visitor = [](auto const a, auto const b) {
			if constexpr (std::floating_point<decltype(a)> || std::floating_point<decltype(b)>) {
				return static_cast<double>(a) == static_cast<double>(b);
			} else {
				return std::cmp_equal(a, b);
			}
		};
		return std::visit(visitor, payload, rhs.payload);
	}

	Payload payload{};

  private:
	// 2^digits: exactly representable, first value past max()
	template <std::integral T>
	[[nodiscard]] static auto upper_bound() -> double {
		return std::ldexp(1.0, std::numeric_limits<T>::digits);
	}
};

struct String {
	std::string text{};
};
} // namespace literal

struct Array {
	std::vector<uj::Json> members{};
};

struct Object {
	ObjectTable<uj::Json> members{};
};

struct Value {
	using Payload = std::variant<literal::Bool, literal::Number, literal::String, Array, Object>;

	template <typename T>
	auto morph() -> T& {
		auto* ret = std::get_if<T>(&payload);
		if (!ret) { ret = &payload.emplace<T>(); }
		return *ret;
	}

	Payload payload{};
};
} // namespace uj::detail
