#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

#include "mm/collections/DeleteMap.hpp"

namespace mm::collections {

/**
 * @brief Unordered set of values whose diff form can express removal.
 *
 * Used for list-like resource fields where only membership matters (actor
 * tags, map object arrays). Values are compared with ==; equality between two
 * vectors ignores order.
 */
template <typename T>
class DeleteVec {
public:
    using Entry = DeleteEntry<T>;
    using const_iterator = typename std::vector<Entry>::const_iterator;

    DeleteVec() = default;
    DeleteVec(std::initializer_list<T> values) {
        for (const auto& value : values) {
            Insert(value);
        }
    }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }
    std::size_t Size() const { return m_entries.size(); }
    bool Empty() const { return m_entries.empty(); }

    void Insert(T value) { Set(std::move(value), false); }
    void Delete(T value) { Set(std::move(value), true); }

    EntryState State(const T& value) const {
        const auto it = FindEntry(value);
        if (it == m_entries.end()) {
            return EntryState::Absent;
        }
        return it->deleted ? EntryState::Deleted : EntryState::Present;
    }

    bool Contains(const T& value) const { return State(value) == EntryState::Present; }

    // Present values in insertion order.
    std::vector<T> Values() const {
        std::vector<T> values;
        values.reserve(m_entries.size());
        for (const auto& entry : m_entries) {
            if (!entry.deleted) {
                values.push_back(entry.value);
            }
        }
        return values;
    }

    DeleteVec Diff(const DeleteVec& modified) const {
        DeleteVec diff;
        for (const auto& entry : modified.m_entries) {
            if (!entry.deleted && !Contains(entry.value)) {
                diff.Insert(entry.value);
            }
        }
        for (const auto& entry : m_entries) {
            if (!entry.deleted && !modified.Contains(entry.value)) {
                diff.Delete(entry.value);
            }
        }
        return diff;
    }

    DeleteVec Merge(const DeleteVec& diff) const {
        DeleteVec merged;
        for (const auto& entry : m_entries) {
            if (!entry.deleted && diff.State(entry.value) != EntryState::Deleted) {
                merged.Insert(entry.value);
            }
        }
        for (const auto& entry : diff.m_entries) {
            if (!entry.deleted) {
                merged.Insert(entry.value);
            }
        }
        return merged;
    }

    bool operator==(const DeleteVec& other) const {
        return m_entries.size() == other.m_entries.size() &&
               std::is_permutation(m_entries.begin(), m_entries.end(), other.m_entries.begin());
    }

private:
    typename std::vector<Entry>::const_iterator FindEntry(const T& value) const {
        return std::find_if(m_entries.begin(), m_entries.end(),
                            [&](const Entry& entry) { return entry.value == value; });
    }

    void Set(T value, bool deleted) {
        const auto it = std::find_if(m_entries.begin(), m_entries.end(),
                                     [&](const Entry& entry) { return entry.value == value; });
        if (it != m_entries.end()) {
            it->deleted = deleted;
            return;
        }
        m_entries.push_back(Entry{std::move(value), deleted});
    }

    std::vector<Entry> m_entries;
};

} // namespace mm::collections
