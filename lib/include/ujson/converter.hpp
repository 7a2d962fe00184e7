#pragma once
#include <ujson/type_info.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace uj {
/// \brief Owning handle to a type-erased instance of a registered type.
class Instance {
  public:
	Instance() = default;

	explicit Instance(TypeInfo const& type, void* object) : m_type(&type), m_object(object) {}

	Instance(Instance&& other) noexcept : m_type(other.m_type), m_object(std::exchange(other.m_object, nullptr)) {}

	auto operator=(Instance&& other) noexcept -> Instance& {
		if (&other != this) {
			reset();
			m_type = other.m_type;
			m_object = std::exchange(other.m_object, nullptr);
		}
		return *this;
	}

	Instance(Instance const&) = delete;
	auto operator=(Instance const&) = delete;

	~Instance() { reset(); }

	[[nodiscard]] auto type() const -> TypeInfo const* { return m_type; }
	[[nodiscard]] auto get() const -> void* { return m_object; }

	/// \brief Release ownership as a pointer to target (an ancestor of type(), or itself).
	/// Throws Error (TypeMismatch) if target is not an ancestor.
	[[nodiscard]] auto release_as(TypeInfo const& target) -> void*;

	explicit operator bool() const { return m_object != nullptr; }

  private:
	void reset();

	TypeInfo const* m_type{};
	void* m_object{};
};

/// \brief Customizes how values of a declared (base) type are written and read.
class Converter {
  public:
	Converter() = default;
	virtual ~Converter() = default;

	Converter(Converter const&) = delete;
	Converter(Converter&&) = delete;
	auto operator=(Converter const&) = delete;
	auto operator=(Converter&&) = delete;

	/// \param object Pointer to the most derived object.
	/// \param runtime Type of the most derived object.
	[[nodiscard]] virtual auto write(void const* object, TypeInfo const& runtime, Mapper const& mapper) const -> Json = 0;
	/// \param declared Type the result must be assignable to.
	[[nodiscard]] virtual auto read(Json const& json, TypeInfo const& declared, Mapper const& mapper) const -> Instance = 0;
};

/// \brief Converter registrations scoped to a single read call.
/// Each entry may be narrowed to one field, so fields sharing a declared type do not interfere.
class Converters {
  public:
	void add(TypeInfo const& declared, std::shared_ptr<Converter const> converter, FieldInfo const* field = nullptr);

	/// \brief Obtain the most recently added converter for declared,
	/// registered either for field or for any field.
	[[nodiscard]] auto find(TypeInfo const& declared, FieldInfo const* field) const -> Converter const*;

	[[nodiscard]] auto empty() const -> bool { return m_entries.empty(); }
	[[nodiscard]] auto size() const -> std::size_t { return m_entries.size(); }

  private:
	struct Entry {
		TypeInfo const* declared{};
		FieldInfo const* field{};
		std::shared_ptr<Converter const> converter{};
	};

	std::vector<Entry> m_entries{};
};
} // namespace uj
