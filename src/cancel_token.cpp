#include "tabflow/cancel_token.h"

namespace tabflow {

void CancelToken::request() {
  if (requested_.exchange(true, std::memory_order_acq_rel))
    return;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (auto& [id, cb] : callbacks_)
      cb();
  }
  // Wait for a guarded call that started before the flag was set.
  std::lock_guard<std::mutex> guard(guard_mutex_);
}

size_t CancelToken::add_callback(Callback cb) {
  std::unique_lock<std::mutex> lock(callbacks_mutex_);
  size_t id = next_id_++;
  if (is_requested()) {
    lock.unlock();
    cb();
    return id;
  }
  callbacks_.emplace(id, std::move(cb));
  return id;
}

void CancelToken::remove_callback(size_t id) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  callbacks_.erase(id);
}

} // namespace tabflow
