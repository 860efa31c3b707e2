// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::HandlePool<Handle> -- bounded pool of native connection handles.
//
// Design:
//   - Handles are opened lazily up to `capacity`, then reused
//   - Checkout() waits (condition variable, deadline) when all are leased
//   - Idle handles are health-checked on checkout; dead ones are replaced
//   - Lease returns its handle on destruction, or destroys it if discarded
//   - Shutdown() refuses new checkouts and waits for leases to come back
//
// Handle requirements: default constructible, IsUsable().

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "unidb/error.hpp"
#include "unidb/log.hpp"

namespace unidb {

template <typename Handle>
class HandlePool {
 public:
  using Opener = std::function<Error(Handle* handle)>;

  // -------------------------------------------------------------------------
  // Lease
  // -------------------------------------------------------------------------

  class Lease {
   public:
    Lease() = default;
    ~Lease() { Release(); }

    // Move
    Lease(Lease&& other) noexcept
        : pool_(other.pool_),
          handle_(std::move(other.handle_)),
          discard_(other.discard_) {
      other.pool_ = nullptr;
      other.discard_ = false;
    }

    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        Release();
        pool_ = other.pool_;
        handle_ = std::move(other.handle_);
        discard_ = other.discard_;
        other.pool_ = nullptr;
        other.discard_ = false;
      }
      return *this;
    }

    // No copy
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Handle* operator->() const { return handle_.get(); }
    Handle& operator*() const { return *handle_; }
    bool Valid() const { return handle_ != nullptr; }

    /// Destroy the handle on release instead of returning it to the pool.
    void Discard() { discard_ = true; }

    void Release() {
      if (pool_ != nullptr && handle_ != nullptr) {
        pool_->Return(std::move(handle_), discard_);
      }
      pool_ = nullptr;
      handle_.reset();
      discard_ = false;
    }

   private:
    friend class HandlePool;

    Lease(HandlePool* pool, std::unique_ptr<Handle> handle)
        : pool_(pool), handle_(std::move(handle)) {}

    HandlePool* pool_ = nullptr;
    std::unique_ptr<Handle> handle_;
    bool discard_ = false;
  };

  // -------------------------------------------------------------------------

  HandlePool(uint32_t capacity, Opener open)
      : capacity_(capacity == 0 ? 1 : capacity), open_(std::move(open)) {}

  ~HandlePool() { Shutdown(); }

  HandlePool(const HandlePool&) = delete;
  HandlePool& operator=(const HandlePool&) = delete;

  /// Lease a handle. `timeout_ms` <= 0 waits without deadline.
  Error Checkout(int64_t timeout_ms, Lease* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
      if (shutdown_) {
        return Error::Make(ErrorCode::kAlreadyClosed, "pool is shut down");
      }

      if (!idle_.empty()) {
        std::unique_ptr<Handle> handle = std::move(idle_.back());
        idle_.pop_back();
        ++leased_;
        lock.unlock();

        if (handle->IsUsable()) {
          *out = Lease(this, std::move(handle));
          return Error::Ok();
        }
        Log().warn("discarding dead pooled handle, reopening");
        handle.reset();
        return OpenLeased(out);
      }

      if (opened_ < capacity_) {
        ++opened_;
        ++leased_;
        lock.unlock();
        return OpenLeased(out);
      }

      if (timeout_ms <= 0) {
        cv_.wait(lock);
      } else if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                 idle_.empty() && opened_ >= capacity_ && !shutdown_) {
        Log().warn("handle checkout timed out after {} ms ({} in use)",
                   timeout_ms, leased_);
        return Error::Format(ErrorCode::kTimeout,
                             "no pooled handle free after %lld ms",
                             static_cast<long long>(timeout_ms));
      }
    }
  }

  /// Refuse further checkouts, destroy idle handles and wait until every
  /// leased handle has been returned. Safe to call more than once.
  void Shutdown() {
    std::vector<std::unique_ptr<Handle>> doomed;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      shutdown_ = true;
      doomed.swap(idle_);
      opened_ -= static_cast<uint32_t>(doomed.size());
      cv_.notify_all();
      cv_.wait(lock, [this] { return leased_ == 0; });
    }
    doomed.clear();
  }

  uint32_t capacity() const { return capacity_; }

  uint32_t OpenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
  }

  uint32_t IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(idle_.size());
  }

  uint32_t LeasedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_;
  }

 private:
  // Called without the lock; the slot is already counted in opened_/leased_.
  Error OpenLeased(Lease* out) {
    std::unique_ptr<Handle> handle(new Handle());
    Error err = open_(handle.get());
    if (!err.ok()) {
      std::lock_guard<std::mutex> lock(mutex_);
      --opened_;
      --leased_;
      cv_.notify_all();
      return err;
    }
    *out = Lease(this, std::move(handle));
    return Error::Ok();
  }

  void Return(std::unique_ptr<Handle> handle, bool discard) {
    std::unique_ptr<Handle> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --leased_;
      if (discard || shutdown_) {
        --opened_;
        doomed = std::move(handle);
      } else {
        idle_.push_back(std::move(handle));
      }
      cv_.notify_all();
    }
  }

  const uint32_t capacity_;
  Opener open_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<Handle>> idle_;
  uint32_t opened_ = 0;  // idle + leased
  uint32_t leased_ = 0;
  bool shutdown_ = false;
};

}  // namespace unidb
