//! # Ordered Map
//!
//! An insertion-ordered string-keyed map used for JSON5 object members.
//!
//! Entries are stored in a vector in the order they were inserted, with a
//! hash index from key to position for average O(1) lookup. Iteration visits
//! entries in insertion order.
//!
//! ## Example
//!
//! ```cpp
//! OrderedMap<int> map;
//! map.insert("b", 1);
//! map.insert("a", 2);
//! for (const auto& [key, value] : map) {
//!     // Visits "b" then "a"
//! }
//! ```

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace json5ast::json {

/// String-keyed map that preserves insertion order.
///
/// Keys are unique and entries are read-only once inserted; iteration yields
/// `const Entry&`. `insert_or_assign` on an existing key replaces the value
/// but keeps the entry at its original position.
template <typename V> class OrderedMap {
public:
    using Entry = std::pair<std::string, V>;
    using const_iterator = typename std::vector<Entry>::const_iterator;

    OrderedMap() = default;

    /// Inserts a new entry at the end.
    ///
    /// # Returns
    ///
    /// `true` if inserted, `false` if the key already exists (the map is unchanged).
    auto insert(std::string key, V value) -> bool {
        if (index_.find(key) != index_.end()) {
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    /// Inserts a new entry, or replaces the value of an existing one in place.
    ///
    /// # Returns
    ///
    /// `true` if a new entry was inserted, `false` if an existing value was replaced.
    auto insert_or_assign(std::string key, V value) -> bool {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    /// Finds the entry for `key`, or returns `end()`.
    [[nodiscard]] auto find(const std::string& key) const -> const_iterator {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return entries_.end();
        }
        return entries_.begin() + static_cast<std::ptrdiff_t>(it->second);
    }

    /// Returns a pointer to the value for `key`, or `nullptr` if absent.
    [[nodiscard]] auto get(const std::string& key) const -> const V* {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        return &entries_[it->second].second;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return index_.find(key) != index_.end();
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    /// Returns the entry at insertion position `index`.
    ///
    /// # Panics
    ///
    /// Throws `std::out_of_range` if `index >= size()`.
    [[nodiscard]] auto at(size_t index) const -> const Entry& {
        return entries_.at(index);
    }

    /// Returns the keys in insertion order.
    [[nodiscard]] auto keys() const -> std::vector<std::string_view> {
        std::vector<std::string_view> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.emplace_back(entry.first);
        }
        return result;
    }

    [[nodiscard]] auto begin() const -> const_iterator {
        return entries_.begin();
    }

    [[nodiscard]] auto end() const -> const_iterator {
        return entries_.end();
    }

    /// Compares entries pairwise in order.
    [[nodiscard]] auto operator==(const OrderedMap& other) const -> bool {
        return entries_ == other.entries_;
    }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace json5ast::json
