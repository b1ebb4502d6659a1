#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace tabflow {

/// Cooperative cancellation shared by every stage of one session.
///
/// request() sets the flag, fires the registered abort callbacks (closing an
/// in-flight stream, for example), then waits for any guarded call that is
/// already running. Work submitted through run_unless_cancelled() after
/// request() has started never runs.
class CancelToken {
public:
  using Callback = std::function<void()>;

  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void request();

  bool is_requested() const { return requested_.load(std::memory_order_acquire); }

  /// Runs fn under the guard unless cancellation was requested.
  /// Returns false if fn was skipped.
  template <typename Fn> bool run_unless_cancelled(Fn&& fn) {
    std::lock_guard<std::mutex> guard(guard_mutex_);
    if (is_requested())
      return false;
    fn();
    return true;
  }

  /// Registers a callback fired by request(). If cancellation was already
  /// requested the callback runs immediately. Returns an id for remove_callback().
  size_t add_callback(Callback cb);
  void remove_callback(size_t id);

private:
  std::atomic<bool> requested_{false};
  std::mutex guard_mutex_;
  std::mutex callbacks_mutex_;
  std::map<size_t, Callback> callbacks_;
  size_t next_id_ = 1;
};

/// RAII registration of a cancel callback.
class ScopedCancelCallback {
public:
  ScopedCancelCallback(CancelToken* token, CancelToken::Callback cb) : token_(token) {
    if (token_)
      id_ = token_->add_callback(std::move(cb));
  }
  ~ScopedCancelCallback() {
    if (token_)
      token_->remove_callback(id_);
  }

  ScopedCancelCallback(const ScopedCancelCallback&) = delete;
  ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

private:
  CancelToken* token_;
  size_t id_ = 0;
};

} // namespace tabflow
