#pragma once
#include <ujson/adapter.hpp>
#include <vector>

namespace uj {
class Mapper;
}

namespace uj::detail {
/// \brief Writes / reads every declared field of a type and its ancestors, root first.
class ReflectiveAdapter : public Adapter {
  public:
	explicit ReflectiveAdapter(Mapper const& mapper, TypeInfo const& type);

	void write(void const* object, Json& out) const final;
	void read(Json const& json, void* object, Converters const& scoped) const final;

  private:
	Mapper const* m_mapper;
	TypeInfo const* m_type;
	std::vector<TypeInfo const*> m_lineage;
};
} // namespace uj::detail
