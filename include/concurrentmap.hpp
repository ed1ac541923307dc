// ConcurrentMap is a reader/writer-locked map whose only compound operations are the atomic ones the document cache needs:
// insert-if-absent and remove-if-still-mapped-to. Values are expected to be cheap to copy (shared_ptrs, mostly), and a missing
// key reads as a default-constructed value.
#pragma once
#include <map>
#include <vector>
#include <shared_mutex>
#include <mutex>


template <typename K, typename V>
class ConcurrentMap {
    std::map<K, V> data;
    mutable std::shared_mutex m_mutex;

public:
    V get(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = data.find(key);
        if (it == data.end()) {
            return V{};
        }
        return it -> second;
    }

    bool contains(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return data.contains(key);
    }

    V put(const K& key, V value) { // returns whatever was there before (or V{})
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = data.find(key);
        if (it == data.end()) {
            data.emplace(key, value);
            return V{};
        }
        V previous = it -> second;
        it -> second = value;
        return previous;
    }

    V putIfAbsent(const K& key, V value) { // returns the existing value if there was one (and leaves it alone), V{} if value went in
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = data.find(key);
        if (it != data.end()) {
            return it -> second;
        }
        data.emplace(key, value);
        return V{};
    }

    V remove(const K& key) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = data.find(key);
        if (it == data.end()) {
            return V{};
        }
        V previous = it -> second;
        data.erase(it);
        return previous;
    }

    bool remove(const K& key, const V& expected) { // only removes if key still maps to expected
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = data.find(key);
        if (it == data.end() || !(it -> second == expected)) {
            return false;
        }
        data.erase(it);
        return true;
    }

    std::vector<V> values() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<V> ret;
        ret.reserve(data.size());
        for (auto& entry : data) {
            ret.push_back(entry.second);
        }
        return ret;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return data.size();
    }
};
