#pragma once
#include <ujson/converter.hpp>

namespace uj {
/// \brief Writes and reads the fields of one registered type.
class Adapter {
  public:
	Adapter() = default;
	virtual ~Adapter() = default;

	Adapter(Adapter const&) = delete;
	Adapter(Adapter&&) = delete;
	auto operator=(Adapter const&) = delete;
	auto operator=(Adapter&&) = delete;

	/// \param object Pointer to an instance of the adapted type.
	/// \param out Object node to write fields into.
	virtual void write(void const* object, Json& out) const = 0;
	/// \param json Object node to read fields from.
	/// \param object Pointer to an instance of the adapted type.
	/// \param scoped Converters registered for this call.
	virtual void read(Json const& json, void* object, Converters const& scoped) const = 0;
};
} // namespace uj
