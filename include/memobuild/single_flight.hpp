#pragma once

#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace memobuild {

/**
 * @brief Collapses concurrent computations of the same key into one.
 *
 * The first caller for a key runs `fn`; callers arriving while it runs wait for and share its
 * value. The entry is dropped once the leader finishes, so later callers run again (by then the
 * result is normally in the cache and `fn` short-circuits).
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class SingleFlight {
public:
    struct Outcome {
        Value value;
        bool leader; ///< True for the caller that actually ran `fn`.
    };

    template <typename Fn>
    Outcome run(const Key &key, Fn &&fn) {
        std::unique_lock lock(mtx_);
        if (auto it = inflight_.find(key); it != inflight_.end()) {
            std::shared_future<Value> fut = it->second;
            lock.unlock();
            return {fut.get(), false};
        }

        std::promise<Value> promise;
        inflight_.emplace(key, promise.get_future().share());
        lock.unlock();

        Value value = [&]() -> Value {
            try {
                return std::forward<Fn>(fn)();
            } catch (...) {
                promise.set_exception(std::current_exception());
                erase(key);
                throw;
            }
        }();

        promise.set_value(value);
        erase(key);
        return {std::move(value), true};
    }

    size_t inflight() const {
        std::lock_guard lock(mtx_);
        return inflight_.size();
    }

private:
    void erase(const Key &key) {
        std::lock_guard lock(mtx_);
        inflight_.erase(key);
    }

    mutable std::mutex mtx_;
    std::unordered_map<Key, std::shared_future<Value>, Hash> inflight_;
};

} // namespace memobuild
