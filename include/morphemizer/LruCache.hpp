/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#ifndef INCLUDE_MORPHEMIZER_LRUCACHE_HPP_
#define INCLUDE_MORPHEMIZER_LRUCACHE_HPP_


//////////////
// includes //
//////////////
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>    // NOLINT
#include <unordered_map>
#include <utility>

#include "boost/optional.hpp"


namespace morphemizer {


/**
 * bounded map which evicts the least recently used entry when it is full.
 * every method locks the cache, so one cache can be shared between threads.
 */
template <typename Key, typename Mapped, typename Hash = std::hash<Key>>
class LruCache {
 public:
    using MappedPtr = std::shared_ptr<const Mapped>;

    /**
     * @param  capacity  maximum number of entries (must be positive)
     */
    explicit LruCache(size_t capacity): _capacity(capacity > 0 ? capacity : 1) {}

    LruCache(const LruCache&) = delete;    ///< delete copy constructor
    LruCache& operator=(const LruCache&) = delete;    ///< delete assignment operator

    /**
     * look up an entry and mark it as most recently used
     * @param  key  key
     * @return  value. boost::none if the key is not cached
     */
    boost::optional<MappedPtr> get(const Key& key) {
        std::unique_lock<std::mutex> lock(_mutex);
        auto found = _cells.find(key);
        if (found == _cells.end()) {
            ++_misses;
            return boost::none;
        }
        ++_hits;
        _queue.splice(_queue.end(), _queue, found->second.queue_it);
        return found->second.value;
    }

    /**
     * insert (or refresh) an entry. evicts the least recently used one when over capacity
     * @param  key  key
     * @param  value  value
     */
    void put(const Key& key, MappedPtr value) {
        std::unique_lock<std::mutex> lock(_mutex);
        auto found = _cells.find(key);
        if (found != _cells.end()) {
            found->second.value = std::move(value);
            _queue.splice(_queue.end(), _queue, found->second.queue_it);
            return;
        }
        auto queue_it = _queue.insert(_queue.end(), key);
        _cells.emplace(key, _cell_t{std::move(value), queue_it});
        while (_cells.size() > _capacity) {
            _cells.erase(_queue.front());
            _queue.pop_front();
        }
    }

    void clear() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cells.clear();
        _queue.clear();
        _hits = 0;
        _misses = 0;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cells.size();
    }

    size_t capacity() const {
        return _capacity;
    }

    size_t hits() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _hits;
    }

    size_t misses() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _misses;
    }

 private:
    using _queue_t = std::list<Key>;

    struct _cell_t {
        MappedPtr value;
        typename _queue_t::iterator queue_it;    ///< position in LRU queue
    };

    const size_t _capacity;    ///< maximum number of entries
    mutable std::mutex _mutex;    ///< mutex to access exclusively
    _queue_t _queue;    ///< keys from least to most recently used
    std::unordered_map<Key, _cell_t, Hash> _cells;
    size_t _hits = 0;
    size_t _misses = 0;
};


}    // namespace morphemizer


#endif    // INCLUDE_MORPHEMIZER_LRUCACHE_HPP_
