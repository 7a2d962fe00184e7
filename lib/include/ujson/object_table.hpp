#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uj {
/// \brief Insertion-ordered string map.
/// Lookups are linear: JSON objects are small and key order is observable on the wire.
template <typename Value>
class ObjectTable {
  public:
	using value_type = std::pair<std::string, Value>;
	using Storage = std::vector<value_type>;
	using iterator = typename Storage::iterator;
	using const_iterator = typename Storage::const_iterator;

	[[nodiscard]] auto begin() -> iterator { return m_entries.begin(); }
	[[nodiscard]] auto end() -> iterator { return m_entries.end(); }
	[[nodiscard]] auto begin() const -> const_iterator { return m_entries.begin(); }
	[[nodiscard]] auto end() const -> const_iterator { return m_entries.end(); }

	[[nodiscard]] auto size() const -> std::size_t { return m_entries.size(); }
	[[nodiscard]] auto empty() const -> bool { return m_entries.empty(); }
	void clear() { m_entries.clear(); }

	[[nodiscard]] auto find(std::string_view const key) -> iterator {
		return std::ranges::find_if(m_entries, [key](value_type const& entry) { return entry.first == key; });
	}

	[[nodiscard]] auto find(std::string_view const key) const -> const_iterator {
		return std::ranges::find_if(m_entries, [key](value_type const& entry) { return entry.first == key; });
	}

	[[nodiscard]] auto contains(std::string_view const key) const -> bool { return find(key) != end(); }

	/// \brief Assign value to an existing key (keeping its position), else append.
	/// \returns Iterator to entry and whether it was inserted.
	auto insert_or_assign(std::string key, Value value) -> std::pair<iterator, bool> {
		if (auto it = find(key); it != end()) {
			it->second = std::move(value);
			return {it, false};
		}
		m_entries.emplace_back(std::move(key), std::move(value));
		return {std::prev(m_entries.end()), true};
	}

	/// \brief Remove entry associated with key.
	/// \returns Removed value if key existed.
	auto extract(std::string_view const key) -> std::optional<Value> {
		auto it = find(key);
		if (it == end()) { return {}; }
		auto ret = std::optional<Value>{std::move(it->second)};
		m_entries.erase(it);
		return ret;
	}

	/// \brief Change the key of an entry in place.
	/// Any existing entry at the target key is replaced.
	/// \returns false if from does not exist.
	auto rename(std::string_view const from, std::string to) -> bool {
		if (from == to) { return contains(from); }
		if (!contains(from)) { return false; }
		extract(to);
		find(from)->first = std::move(to);
		return true;
	}

  private:
	Storage m_entries{};
};
} // namespace uj
