#pragma once

// Copyright (c) 2024-2026 The Tally Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Lock-order tracking (debug builds only)
// ---------------------------------------------------------------------------

/// Identity shared by Mutex and SharedMutex for the lock-order checker.
/// Order IDs are handed out at construction, so a mutex constructed earlier
/// must be acquired earlier on any thread that holds both.
struct LockOrderEntry {
    std::string name;
    uint64_t order = 0;
};

#ifndef NDEBUG

uint64_t next_mutex_order_id();

/// Record that the calling thread is about to acquire @p entry. Logs a
/// potential-deadlock warning if a lock with an equal or higher order ID is
/// already held.
void debug_lock_push(const LockOrderEntry* entry);

void debug_lock_pop(const LockOrderEntry* entry);

/// Number of exclusive locks the calling thread currently holds.
std::size_t debug_held_lock_count();

#endif  // !NDEBUG

// ---------------------------------------------------------------------------
// Mutex
// ---------------------------------------------------------------------------

/// Named wrapper around std::mutex.
class Mutex {
public:
    explicit Mutex(std::string_view name = "")
    {
        entry_.name = std::string(name);
#ifndef NDEBUG
        entry_.order = next_mutex_order_id();
#endif
    }

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(&entry_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(&entry_);
#endif
    }

    bool try_lock()
    {
        bool acquired = mutex_.try_lock();
#ifndef NDEBUG
        if (acquired) debug_lock_push(&entry_);
#endif
        return acquired;
    }

    const std::string& name() const noexcept { return entry_.name; }

private:
    std::mutex mutex_;
    LockOrderEntry entry_;
};

// ---------------------------------------------------------------------------
// SharedMutex
// ---------------------------------------------------------------------------

/// Named wrapper around std::shared_mutex. Only the exclusive side takes
/// part in lock-order tracking; readers never block each other.
class SharedMutex {
public:
    explicit SharedMutex(std::string_view name = "")
    {
        entry_.name = std::string(name);
#ifndef NDEBUG
        entry_.order = next_mutex_order_id();
#endif
    }

    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(&entry_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(&entry_);
#endif
    }

    void lock_shared() { mutex_.lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }

    const std::string& name() const noexcept { return entry_.name; }

private:
    std::shared_mutex mutex_;
    LockOrderEntry entry_;
};

// ---------------------------------------------------------------------------
// UniqueLock  (core::Mutex)
// ---------------------------------------------------------------------------

class UniqueLock {
public:
    explicit UniqueLock(Mutex& mtx)
        : mutex_(&mtx), owns_(false)
    {
        mutex_->lock();
        owns_ = true;
    }

    UniqueLock(Mutex& mtx, std::defer_lock_t) noexcept
        : mutex_(&mtx), owns_(false)
    {
    }

    ~UniqueLock()
    {
        if (owns_) mutex_->unlock();
    }

    UniqueLock(const UniqueLock&) = delete;
    UniqueLock& operator=(const UniqueLock&) = delete;

    void lock()
    {
        mutex_->lock();
        owns_ = true;
    }

    void unlock()
    {
        mutex_->unlock();
        owns_ = false;
    }

    bool owns_lock() const noexcept { return owns_; }

private:
    Mutex* mutex_;
    bool owns_;
};

// ---------------------------------------------------------------------------
// SharedLock / WriteLock  (core::SharedMutex)
// ---------------------------------------------------------------------------

/// Reader guard.
class SharedLock {
public:
    explicit SharedLock(SharedMutex& mtx) : mutex_(&mtx)
    {
        mutex_->lock_shared();
    }

    ~SharedLock() { mutex_->unlock_shared(); }

    SharedLock(const SharedLock&) = delete;
    SharedLock& operator=(const SharedLock&) = delete;

private:
    SharedMutex* mutex_;
};

/// Exclusive (writer) guard. Can be released early with unlock().
class WriteLock {
public:
    explicit WriteLock(SharedMutex& mtx)
        : mutex_(&mtx), owns_(false)
    {
        mutex_->lock();
        owns_ = true;
    }

    ~WriteLock()
    {
        if (owns_) mutex_->unlock();
    }

    WriteLock(const WriteLock&) = delete;
    WriteLock& operator=(const WriteLock&) = delete;

    void unlock()
    {
        mutex_->unlock();
        owns_ = false;
    }

    bool owns_lock() const noexcept { return owns_; }

private:
    SharedMutex* mutex_;
    bool owns_;
};

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

#define CORE_SYNC_CAT_(a, b)  a##b
#define CORE_SYNC_CAT(a, b)   CORE_SYNC_CAT_(a, b)

/// Exclusive lock on @p cs for the enclosing scope.
#define LOCK(cs) \
    core::UniqueLock CORE_SYNC_CAT(lock_, __LINE__)(cs)

/// Shared lock on the SharedMutex @p cs for the enclosing scope.
#define READ_LOCK(cs) \
    core::SharedLock CORE_SYNC_CAT(rlock_, __LINE__)(cs)

}  // namespace core
