#pragma once

#include "podengine/core/Guarded.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace podengine {
namespace core {

/// Concurrent collection of items keyed by integer id.
///
/// Holds a map id -> item handle, the full display order and the order of
/// the items that pass the current display filter. The three parts have
/// their own locks and are always taken in the order map, order, filtered.
/// Items live behind their own lock (see Guarded), so a handle obtained with
/// get() can be read or written while other threads insert or remove.
///
/// T must provide `std::int64_t getId() const`.
///
/// Invariants: the key set of the full order equals the key set of the map;
/// the filtered order is a subset of it.
template <typename T>
class Catalog {
public:
    using Id = std::int64_t;
    using Handle = std::shared_ptr<Guarded<T>>;

    Catalog() = default;

    explicit Catalog(std::vector<T> items) {
        replaceAll(std::move(items));
    }

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    void insert(T item) {
        insert(std::make_shared<Guarded<T>>(std::move(item)));
    }

    // Inserting an id that is already present replaces the handle and keeps
    // its position.
    void insert(Handle item) {
        const Id id = item->read([](const T& value) { return value.getId(); });
        std::scoped_lock lock(mapMutex_, orderMutex_, filteredMutex_);
        const bool isNew = map_.insert_or_assign(id, std::move(item)).second;
        if (isNew) {
            order_.push_back(id);
            filtered_.push_back(id);
        }
    }

    bool remove(Id id) {
        std::scoped_lock lock(mapMutex_, orderMutex_, filteredMutex_);
        if (map_.erase(id) == 0) {
            return false;
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        filtered_.erase(std::remove(filtered_.begin(), filtered_.end(), id), filtered_.end());
        return true;
    }

    // Wholesale reload; the given order becomes both the full and the
    // filtered order.
    void replaceAll(std::vector<T> items) {
        std::vector<Handle> handles;
        handles.reserve(items.size());
        for (auto& item : items) {
            handles.push_back(std::make_shared<Guarded<T>>(std::move(item)));
        }
        replaceAll(std::move(handles));
    }

    void replaceAll(std::vector<Handle> items) {
        std::vector<std::pair<Id, Handle>> keyed;
        keyed.reserve(items.size());
        for (auto& item : items) {
            const Id id = item->read([](const T& value) { return value.getId(); });
            keyed.emplace_back(id, std::move(item));
        }

        std::scoped_lock lock(mapMutex_, orderMutex_, filteredMutex_);
        map_.clear();
        order_.clear();
        filtered_.clear();
        for (auto& entry : keyed) {
            if (map_.insert_or_assign(entry.first, std::move(entry.second)).second) {
                order_.push_back(entry.first);
            }
        }
        filtered_ = order_;
    }

    // Empty handle when the id is unknown.
    Handle get(Id id) const {
        std::lock_guard<std::mutex> lock(mapMutex_);
        auto it = map_.find(id);
        if (it == map_.end()) {
            return nullptr;
        }
        return it->second;
    }

    bool contains(Id id) const {
        std::lock_guard<std::mutex> lock(mapMutex_);
        return map_.count(id) > 0;
    }

    /// Applies fn to every item in full or filtered order and returns the
    /// collected results. The catalog locks are released before returning,
    /// so callers never hold them across their own logic.
    template <typename F>
    auto map(F fn, bool filtered) const {
        using Result = std::decay_t<std::invoke_result_t<F&, const T&>>;
        std::vector<Result> results;
        if (filtered) {
            std::scoped_lock lock(mapMutex_, filteredMutex_);
            results.reserve(filtered_.size());
            for (Id id : filtered_) {
                results.push_back(map_.at(id)->read(fn));
            }
        } else {
            std::scoped_lock lock(mapMutex_, orderMutex_);
            results.reserve(order_.size());
            for (Id id : order_) {
                results.push_back(map_.at(id)->read(fn));
            }
        }
        return results;
    }

    /// Visits the handles in full order; items for which fn returns an
    /// empty optional are skipped.
    template <typename F>
    auto filterMap(F fn) const {
        using Optional = std::decay_t<std::invoke_result_t<F&, const Handle&>>;
        std::vector<typename Optional::value_type> results;
        std::scoped_lock lock(mapMutex_, orderMutex_);
        for (Id id : order_) {
            Optional value = fn(map_.at(id));
            if (value) {
                results.push_back(std::move(*value));
            }
        }
        return results;
    }

    template <typename F>
    auto mapSingle(Id id, F fn) const {
        using Result = std::decay_t<std::invoke_result_t<F&, const T&>>;
        Handle handle = get(id);
        if (!handle) {
            return std::optional<Result>{};
        }
        return std::optional<Result>{handle->read(fn)};
    }

    std::vector<Handle> handles(bool filtered) const {
        std::vector<Handle> results;
        if (filtered) {
            std::scoped_lock lock(mapMutex_, filteredMutex_);
            for (Id id : filtered_) {
                results.push_back(map_.at(id));
            }
        } else {
            std::scoped_lock lock(mapMutex_, orderMutex_);
            for (Id id : order_) {
                results.push_back(map_.at(id));
            }
        }
        return results;
    }

    std::vector<Id> order(bool filtered) const {
        if (filtered) {
            std::lock_guard<std::mutex> lock(filteredMutex_);
            return filtered_;
        }
        std::lock_guard<std::mutex> lock(orderMutex_);
        return order_;
    }

    // Ids unknown to the map are dropped so the filtered order stays a
    // subset of the full order.
    void replaceFilteredOrder(std::vector<Id> ids) {
        std::scoped_lock lock(mapMutex_, filteredMutex_);
        ids.erase(std::remove_if(ids.begin(), ids.end(),
                                 [this](Id id) { return map_.count(id) == 0; }),
                  ids.end());
        filtered_ = std::move(ids);
    }

    /// Replaces the full order with a permutation of itself (e.g. the user
    /// moved a queue entry). The filtered order is rearranged to follow it.
    /// Returns false and changes nothing if ids is not a permutation.
    bool reorder(const std::vector<Id>& ids) {
        std::scoped_lock lock(mapMutex_, orderMutex_, filteredMutex_);
        if (ids.size() != order_.size()) {
            return false;
        }
        std::unordered_set<Id> seen;
        for (Id id : ids) {
            if (map_.count(id) == 0 || !seen.insert(id).second) {
                return false;
            }
        }
        std::unordered_set<Id> visible(filtered_.begin(), filtered_.end());
        order_ = ids;
        filtered_.clear();
        for (Id id : order_) {
            if (visible.count(id) > 0) {
                filtered_.push_back(id);
            }
        }
        return true;
    }

    /// Stable sort of both orders by a key computed from each item.
    template <typename KeyFn>
    void sortBy(KeyFn keyFn) {
        using Key = std::decay_t<std::invoke_result_t<KeyFn&, const T&>>;
        std::scoped_lock lock(mapMutex_, orderMutex_, filteredMutex_);
        std::unordered_map<Id, Key> keys;
        for (const auto& entry : map_) {
            keys.emplace(entry.first, entry.second->read(keyFn));
        }
        auto byKey = [&keys](Id a, Id b) { return keys.at(a) < keys.at(b); };
        std::stable_sort(order_.begin(), order_.end(), byKey);
        std::stable_sort(filtered_.begin(), filtered_.end(), byKey);
    }

    void reverse() {
        std::scoped_lock lock(orderMutex_, filteredMutex_);
        std::reverse(order_.begin(), order_.end());
        std::reverse(filtered_.begin(), filtered_.end());
    }

    std::size_t size(bool filtered) const {
        if (filtered) {
            std::lock_guard<std::mutex> lock(filteredMutex_);
            return filtered_.size();
        }
        std::lock_guard<std::mutex> lock(orderMutex_);
        return order_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(orderMutex_);
        return order_.empty();
    }

private:
    mutable std::mutex mapMutex_;
    mutable std::mutex orderMutex_;
    mutable std::mutex filteredMutex_;
    std::unordered_map<Id, Handle> map_;
    std::vector<Id> order_;
    std::vector<Id> filtered_;
};

} // namespace core
} // namespace podengine
