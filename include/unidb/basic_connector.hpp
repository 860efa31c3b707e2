// Copyright (c) 2024 liudegui. MIT License.
//
// unidb::BasicConnector<Backend> -- pooled connector over backend traits.
//
// Design:
//   - One template implements the connector contract for every backend;
//     the traits struct supplies the native handle and its parameters
//   - Owns a HandlePool<Backend::Handle>; never shares handles
//   - Create() performs an eager connectivity check and fails fast
//   - Closed flag checked before any pool or driver access
//   - A failed handle is discarded, never returned to the pool, when the
//     backend's ShouldDiscard() says it is no longer trustworthy
//
// Backend traits:
//   struct XBackend {
//     using Handle = ...;   // Open/IsUsable/Ping/Query/Exec
//     using Params = ...;   // has pool_size and timeout_sec
//     static constexpr Backend kTag = ...;
//     static Error MakeParams(const ConnectionDescriptor&, Params*);
//     static std::string Describe(const Params&);
//     static bool ShouldDiscard(const Params&, const Error&);
//   };

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "unidb/column_batch.hpp"
#include "unidb/config.hpp"
#include "unidb/connector.hpp"
#include "unidb/error.hpp"
#include "unidb/handle_pool.hpp"
#include "unidb/log.hpp"
#include "unidb/value.hpp"

namespace unidb {

/// Errors after which a network handle's session state is unknown.
inline bool IsConnectionLevelError(const Error& err) {
  return err.code == ErrorCode::kConnectionFailure ||
         err.code == ErrorCode::kTimeout || err.code == ErrorCode::kIoFailure;
}

template <typename Backend_>
class BasicConnector final : public CrudConnector {
 public:
  using Traits = Backend_;
  using Handle = typename Traits::Handle;
  using Params = typename Traits::Params;
  using Pool = HandlePool<Handle>;
  using Lease = typename Pool::Lease;

  /// Derive backend parameters from `descriptor`, open one handle and
  /// ping it. The descriptor is not retained.
  static Error Create(const ConnectionDescriptor& descriptor,
                      std::unique_ptr<CrudConnector>* out) {
    Params params;
    Error err = Traits::MakeParams(descriptor, &params);
    if (!err.ok()) { return err; }

    std::unique_ptr<BasicConnector> conn(new BasicConnector(std::move(params)));
    err = conn->Ping();
    if (!err.ok()) {
      conn->closed_.store(true);
      conn->pool_.Shutdown();
      Log().debug("{} connect failed: {} ({})", BackendName(Traits::kTag),
                  err.message, err.name());
      if (err.code != ErrorCode::kConnectionFailure) {
        return Error::Format(ErrorCode::kConnectionFailure, "%s: %s",
                             err.name(), err.message);
      }
      return err;
    }

    Log().info("{} connector open: {} (pool {})", BackendName(Traits::kTag),
               Traits::Describe(conn->params_), conn->pool_.capacity());
    *out = std::move(conn);
    return Error::Ok();
  }

  ~BasicConnector() override { Close(); }

  // --- Tier 1 ---

  using Connector::Execute;

  Error Execute(const std::string& sql, const std::vector<Value>& params,
                ColumnBatch* out) override {
    if (closed_.load()) { return ClosedError(); }
    Lease lease;
    Error err = pool_.Checkout(CheckoutTimeoutMs(), &lease);
    if (!err.ok()) { return err; }

    Log().debug("{} query: {}", BackendName(Traits::kTag), sql);
    err = lease->Query(sql, params, out);
    if (!err.ok()) { Settle(&lease, err); }
    return err;
  }

  Error ExecuteMutation(const std::string& sql,
                        const std::vector<Value>& params,
                        OperationOutcome* out) override {
    if (closed_.load()) { return ClosedError(); }
    Lease lease;
    Error err = pool_.Checkout(CheckoutTimeoutMs(), &lease);
    if (!err.ok()) { return err; }

    Log().debug("{} exec: {}", BackendName(Traits::kTag), sql);
    uint64_t affected = 0;
    err = lease->Exec(sql, params, &affected);
    if (!err.ok()) {
      Settle(&lease, err);
      return err;
    }
    *out = OperationOutcome::Success(affected);
    return Error::Ok();
  }

  bool IsAlive() override {
    if (closed_.load()) { return false; }
    return Ping().ok();
  }

  Error Close() override {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
      return Error::Ok();
    }
    pool_.Shutdown();
    Log().info("{} connector closed", BackendName(Traits::kTag));
    return Error::Ok();
  }

  bool IsClosed() const override { return closed_.load(); }

  Backend backend() const override { return Traits::kTag; }

  /// Pool introspection for diagnostics and tests.
  const Pool& pool() const { return pool_; }

 private:
  explicit BasicConnector(Params params)
      : params_(std::move(params)),
        pool_(params_.pool_size,
              [this](Handle* handle) { return handle->Open(params_); }) {}

  int64_t CheckoutTimeoutMs() const {
    return static_cast<int64_t>(params_.timeout_sec) * 1000;
  }

  Error Ping() {
    Lease lease;
    Error err = pool_.Checkout(CheckoutTimeoutMs(), &lease);
    if (!err.ok()) { return err; }
    err = lease->Ping();
    if (!err.ok()) { Settle(&lease, err); }
    return err;
  }

  void Settle(Lease* lease, const Error& err) {
    Log().debug("{} native error mapped to {}: {}", BackendName(Traits::kTag),
                err.name(), err.message);
    if (Traits::ShouldDiscard(params_, err)) {
      Log().warn("discarding {} handle after {}: {}",
                 BackendName(Traits::kTag), err.name(), err.message);
      lease->Discard();
    }
  }

  const Params params_;
  Pool pool_;
  std::atomic<bool> closed_{false};
};

}  // namespace unidb
