#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace kvcall::client {

/**
 * Append-mostly list published as immutable snapshots.
 *
 * Readers take a shared_ptr snapshot with one atomic load and iterate it lock-free; concurrent
 * registrations never disturb an iteration in progress. Writers are serialized by a mutex and
 * publish a fresh copy. Entries keep registration order.
 */
template <typename T> class SnapshotList {
public:
    using Id = std::uint64_t;

    struct Entry {
        Id id;
        T item;
    };

    using Snapshot = std::shared_ptr<const std::vector<Entry>>;

    Id add(T item) {
        std::lock_guard<std::mutex> lk(writeMutex_);
        auto next = std::make_shared<std::vector<Entry>>(current());
        const Id id = ++lastId_;
        next->push_back(Entry{id, std::move(item)});
        publish(std::move(next));
        return id;
    }

    bool remove(Id id) {
        std::lock_guard<std::mutex> lk(writeMutex_);
        auto next = std::make_shared<std::vector<Entry>>(current());
        const auto before = next->size();
        std::erase_if(*next, [id](const Entry& e) { return e.id == id; });
        if (next->size() == before)
            return false;
        publish(std::move(next));
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(writeMutex_);
        publish(std::make_shared<std::vector<Entry>>());
    }

    // Cheap emptiness probe for hot paths.
    bool empty() const noexcept { return count_.load(std::memory_order_acquire) == 0; }

    std::size_t size() const noexcept { return count_.load(std::memory_order_acquire); }

    Snapshot snapshot() const { return std::atomic_load_explicit(&snap_, std::memory_order_acquire); }

private:
    std::vector<Entry> current() const {
        auto snap = snapshot();
        return snap ? *snap : std::vector<Entry>{};
    }

    void publish(std::shared_ptr<std::vector<Entry>> next) {
        const auto n = next->size();
        std::atomic_store_explicit(&snap_, Snapshot(std::move(next)), std::memory_order_release);
        count_.store(n, std::memory_order_release);
    }

    std::mutex writeMutex_;
    Id lastId_{0};
    std::atomic<std::size_t> count_{0};
    // Plain shared_ptr storage; synchronization via atomic_load/store free functions above
    Snapshot snap_{nullptr};
};

} // namespace kvcall::client
