//
//  Map wrapper where we can iterate through
//  items in insertion-order.
//

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <vector>

namespace patchy {

template <typename K, typename V>
struct OrderedMap {
    std::map<K, V> m_;

    // All map keys in insert-order
    std::vector<K> keys_;

    V&
    operator[](const K& key) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    void
    insert(const K& key, V value) {
        (*this)[key] = std::move(value);
    }

    bool
    remove(const K& key) {
        if (!contains(key)) {
            return false;
        }
        keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
        m_.erase(key);
        return true;
    }

    V*
    find(const K& key) {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    const V*
    find(const K& key) const {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    bool
    contains(const K& key) const {
        return m_.contains(key);
    }

    std::size_t
    size() const {
        return keys_.size();
    }

    const std::vector<K>&
    keys() const {
        return keys_;
    }

    void
    for_each(const std::function<void(const K&, V&)>& cb) {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }

    void
    for_each(const std::function<void(const K&, const V&)>& cb) const {
        for (auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }
};

}  // namespace patchy
