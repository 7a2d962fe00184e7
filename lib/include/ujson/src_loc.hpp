#pragma once
#include <cstdint>

namespace uj {
/// \brief Source location.
struct SrcLoc {
	std::uint64_t line{};
	std::uint64_t column{};
};
} // namespace uj
