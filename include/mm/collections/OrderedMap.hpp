#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mm::collections {

/**
 * @brief Insertion-ordered map with a std::map compatible surface.
 *
 * Entries live in a vector in insertion order; a key index gives logarithmic
 * lookup. Reassigning an existing key keeps its original position. Equality
 * ignores order: two maps are equal when they hold the same key/value pairs.
 *
 * Keys reached through iterators must not be modified.
 */
template <typename K, typename V>
class OrderedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K, V>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> entries) {
        for (const auto& entry : entries) {
            insert_or_assign(entry.first, entry.second);
        }
    }

    iterator begin() { return m_entries.begin(); }
    iterator end() { return m_entries.end(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    void reserve(std::size_t count) { m_entries.reserve(count); }

    void clear() {
        m_entries.clear();
        m_index.clear();
    }

    iterator find(const K& key) {
        const auto it = m_index.find(key);
        return it == m_index.end() ? m_entries.end() : m_entries.begin() + static_cast<std::ptrdiff_t>(it->second);
    }

    const_iterator find(const K& key) const {
        const auto it = m_index.find(key);
        return it == m_index.end() ? m_entries.end() : m_entries.begin() + static_cast<std::ptrdiff_t>(it->second);
    }

    bool contains(const K& key) const { return m_index.find(key) != m_index.end(); }

    V& at(const K& key) {
        const auto it = find(key);
        if (it == end()) {
            throw std::out_of_range("OrderedMap::at: key not found");
        }
        return it->second;
    }

    const V& at(const K& key) const {
        const auto it = find(key);
        if (it == end()) {
            throw std::out_of_range("OrderedMap::at: key not found");
        }
        return it->second;
    }

    V& operator[](const K& key) {
        const auto it = find(key);
        if (it != end()) {
            return it->second;
        }
        m_index.emplace(key, m_entries.size());
        m_entries.emplace_back(key, V{});
        return m_entries.back().second;
    }

    std::pair<iterator, bool> insert_or_assign(K key, V value) {
        const auto it = m_index.find(key);
        if (it != m_index.end()) {
            auto entry = m_entries.begin() + static_cast<std::ptrdiff_t>(it->second);
            entry->second = std::move(value);
            return {entry, false};
        }
        m_index.emplace(key, m_entries.size());
        m_entries.emplace_back(std::move(key), std::move(value));
        return {m_entries.end() - 1, true};
    }

    // Removes the key, shifting later entries down. Returns the number removed.
    std::size_t erase(const K& key) {
        const auto it = m_index.find(key);
        if (it == m_index.end()) {
            return 0;
        }
        const std::size_t position = it->second;
        m_index.erase(it);
        m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(position));
        for (auto& [indexedKey, slot] : m_index) {
            if (slot > position) {
                --slot;
            }
        }
        return 1;
    }

    bool operator==(const OrderedMap& other) const {
        if (m_entries.size() != other.m_entries.size()) {
            return false;
        }
        for (const auto& [key, value] : m_entries) {
            const auto it = other.find(key);
            if (it == other.end() || !(it->second == value)) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<value_type> m_entries;
    std::map<K, std::size_t> m_index;
};

} // namespace mm::collections
