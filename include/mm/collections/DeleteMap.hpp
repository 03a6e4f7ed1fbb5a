#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <utility>

#include "mm/collections/Mergeable.hpp"
#include "mm/collections/OrderedMap.hpp"

namespace mm::collections {

// Absent: the key was never mentioned. Deleted: a tombstone recorded by a diff.
enum class EntryState {
    Absent,
    Present,
    Deleted
};

template <typename V>
struct DeleteEntry {
    V value{};
    bool deleted = false;

    bool operator==(const DeleteEntry&) const = default;
};

template <typename K, typename V>
using SortedStorage = std::map<K, V>;

/**
 * @brief Map whose diff form can express key deletion.
 *
 * A base or fully merged map only holds present entries. Diff() records keys
 * that disappeared as tombstones; Merge() removes tombstoned keys, writes
 * present ones and carries every key the diff does not mention.
 *
 * Storage is OrderedMap (insertion order) or SortedStorage (key order).
 */
template <typename K, typename V, template <typename, typename> class Storage>
class BasicDeleteMap {
public:
    using Entries = Storage<K, DeleteEntry<V>>;
    using const_iterator = typename Entries::const_iterator;

    BasicDeleteMap() = default;
    BasicDeleteMap(std::initializer_list<std::pair<K, V>> values) {
        for (const auto& [key, value] : values) {
            Insert(key, value);
        }
    }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    // Stored entries, tombstones included.
    std::size_t Size() const { return m_entries.size(); }
    bool Empty() const { return m_entries.empty(); }

    std::size_t PresentCount() const {
        std::size_t count = 0;
        for (const auto& entry : m_entries) {
            count += entry.second.deleted ? 0 : 1;
        }
        return count;
    }

    bool HasTombstones() const { return PresentCount() != m_entries.size(); }

    void Insert(K key, V value) {
        m_entries.insert_or_assign(std::move(key), DeleteEntry<V>{std::move(value), false});
    }

    void Delete(K key) {
        m_entries.insert_or_assign(std::move(key), DeleteEntry<V>{V{}, true});
    }

    // Drops the key entirely, tombstone or not.
    bool Remove(const K& key) { return m_entries.erase(key) > 0; }

    void Clear() { m_entries.clear(); }

    EntryState State(const K& key) const {
        const auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return EntryState::Absent;
        }
        return it->second.deleted ? EntryState::Deleted : EntryState::Present;
    }

    bool Contains(const K& key) const { return State(key) == EntryState::Present; }

    const V* Get(const K& key) const {
        const auto it = m_entries.find(key);
        return it == m_entries.end() || it->second.deleted ? nullptr : &it->second.value;
    }

    V* Get(const K& key) {
        const auto it = m_entries.find(key);
        return it == m_entries.end() || it->second.deleted ? nullptr : &it->second.value;
    }

    template <typename Fn>
    void ForEachPresent(Fn&& fn) const {
        for (const auto& [key, entry] : m_entries) {
            if (!entry.deleted) {
                fn(key, entry.value);
            }
        }
    }

    // Whole-value diff: changed or new keys carry the modified value.
    BasicDeleteMap Diff(const BasicDeleteMap& modified) const {
        BasicDeleteMap diff;
        modified.ForEachPresent([&](const K& key, const V& value) {
            const V* current = Get(key);
            if (!current || !(*current == value)) {
                diff.Insert(key, value);
            }
        });
        ForEachPresent([&](const K& key, const V&) {
            if (!modified.Contains(key)) {
                diff.Delete(key);
            }
        });
        return diff;
    }

    BasicDeleteMap Merge(const BasicDeleteMap& diff) const {
        BasicDeleteMap merged(*this);
        for (const auto& [key, entry] : diff.m_entries) {
            if (entry.deleted) {
                merged.Remove(key);
            } else {
                merged.Insert(key, entry.value);
            }
        }
        return merged;
    }

    // Like Diff(), but keys present on both sides hold MergeTraits<V>::Diff.
    BasicDeleteMap DeepDiff(const BasicDeleteMap& modified) const {
        BasicDeleteMap diff;
        modified.ForEachPresent([&](const K& key, const V& value) {
            const V* current = Get(key);
            if (!current) {
                diff.Insert(key, value);
            } else if (!(*current == value)) {
                diff.Insert(key, MergeTraits<V>::Diff(*current, value));
            }
        });
        ForEachPresent([&](const K& key, const V&) {
            if (!modified.Contains(key)) {
                diff.Delete(key);
            }
        });
        return diff;
    }

    BasicDeleteMap DeepMerge(const BasicDeleteMap& diff) const {
        BasicDeleteMap merged(*this);
        for (const auto& [key, entry] : diff.m_entries) {
            if (entry.deleted) {
                merged.Remove(key);
            } else if (const V* current = Get(key)) {
                merged.Insert(key, MergeTraits<V>::Merge(*current, entry.value));
            } else {
                merged.Insert(key, entry.value);
            }
        }
        return merged;
    }

    bool operator==(const BasicDeleteMap& other) const { return m_entries == other.m_entries; }

private:
    Entries m_entries;
};

template <typename K, typename V>
using DeleteMap = BasicDeleteMap<K, V, OrderedMap>;

template <typename K, typename V>
using SortedDeleteMap = BasicDeleteMap<K, V, SortedStorage>;

} // namespace mm::collections
