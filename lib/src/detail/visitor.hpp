#pragma once

namespace uj::detail {
template <typename... Ts>
struct Visitor : Ts... {
	using Ts::operator()...;
};
} // namespace uj::detail
