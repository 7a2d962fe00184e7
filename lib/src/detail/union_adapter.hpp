#pragma once
#include <ujson/adapter.hpp>
#include <ujson/union_field.hpp>
#include <ujson/wrapper_adapter.hpp>
#include <memory>
#include <span>
#include <vector>

namespace uj::detail {
/// \brief Resolves union fields around a delegate that handles every other field.
/// Write: delegate, then flatten each resolved union slot to its serialized name.
/// Read: wrap each resolved slot into an envelope and scope the envelope converter
/// to that field for the delegate's read.
class UnionAdapter : public Adapter {
  public:
	explicit UnionAdapter(std::vector<UnionFieldSpec> specs, std::unique_ptr<Adapter const> delegate, std::shared_ptr<WrapperAdapter const> envelope);

	void write(void const* object, Json& out) const final;
	void read(Json const& json, void* object, Converters const& scoped) const final;

	[[nodiscard]] auto specs() const -> std::span<UnionFieldSpec const> { return m_specs; }

	/// \brief Obtain the mapping selected by the discriminator in tree.
	/// \returns nullptr if no mapping matches (passthrough).
	/// Throws Error if the discriminator is missing, null, or not a scalar.
	[[nodiscard]] static auto resolve(UnionFieldSpec const& spec, Json const& tree) -> MappingEntry const*;

  private:
	std::vector<UnionFieldSpec> m_specs;
	std::unique_ptr<Adapter const> m_delegate;
	std::shared_ptr<WrapperAdapter const> m_envelope;
};
} // namespace uj::detail
