#pragma once

#include "blob_uploader.h"
#include "cancel_token.h"
#include "error.h"
#include "options.h"
#include "progress.h"
#include "size_router.h"
#include "types.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tabflow {

enum class SessionState : uint8_t { IDLE, UPLOADING, PROCESSING, COMPLETE, FAILED };

inline const char* session_state_name(SessionState state) {
  switch (state) {
  case SessionState::IDLE:
    return "idle";
  case SessionState::UPLOADING:
    return "uploading";
  case SessionState::PROCESSING:
    return "processing";
  case SessionState::COMPLETE:
    return "complete";
  case SessionState::FAILED:
    return "error";
  default:
    return "unknown";
  }
}

// Point-in-time copy of a session, safe to read from any thread.
struct SessionSnapshot {
  std::string id;
  std::string filename;
  Strategy strategy = Strategy::WHOLE_FILE;
  SessionState state = SessionState::IDLE;
  int progress = 0;
  uint64_t loaded_rows = 0;
  uint64_t loaded_chunks = 0;
  std::optional<Error> error;
  std::optional<MaterializedTable> table;
  bool cancelled = false;
};

/// Receives session events. Callbacks run on the thread that caused the
/// event and are serialized per session. Exactly one of on_complete() or
/// on_error() is delivered; cancellation arrives as on_error() with a
/// CANCELLED error.
class SessionObserver {
public:
  virtual ~SessionObserver() = default;
  virtual void on_state_changed(const std::string& /*session_id*/, SessionState /*from*/,
                                SessionState /*to*/) {}
  virtual void on_progress(const std::string& /*session_id*/, int /*percent*/) {}
  virtual void on_chunk_loaded(const std::string& /*session_id*/, uint64_t /*chunk_index*/,
                               uint64_t /*loaded_rows*/) {}
  virtual void on_complete(const std::string& /*session_id*/, const MaterializedTable& /*table*/) {}
  virtual void on_error(const std::string& /*session_id*/, const Error& /*error*/) {}
};

/**
 * @brief State machine and progress owner for one upload.
 *
 * States move Idle -> Uploading -> Processing -> Complete or Error. cancel()
 * from a non-terminal state requests the session's CancelToken and returns the
 * session to Idle carrying a CANCELLED error. Once a session has ended every
 * further transition is refused.
 *
 * @note Thread Safety: every method may be called from any thread. cancel()
 *       is typically called from a UI thread while the pipeline runs.
 */
class IngestSession {
public:
  IngestSession(std::string id, LocalFile file, Strategy strategy,
                const ProgressOptions& progress = ProgressOptions());

  IngestSession(const IngestSession&) = delete;
  IngestSession& operator=(const IngestSession&) = delete;

  // Observers must outlive the session or unsubscribe first.
  void subscribe(SessionObserver* observer);
  void unsubscribe(SessionObserver* observer);

  bool begin_upload();
  void report_upload(int percent);
  bool begin_processing();
  void report_metadata();
  void report_chunk(uint64_t chunk_index, uint64_t loaded_rows, uint64_t row_estimate);
  // WHOLE_FILE: rows handed to the engine in one call
  void report_loaded(uint64_t rows);

  bool complete(const MaterializedTable& table);
  // A CANCELLED error is routed to the cancellation path.
  bool fail(const Error& error);
  bool cancel();

  SessionSnapshot snapshot() const;
  SessionState state() const;
  int progress() const;
  bool ended() const;

  const std::string& id() const { return id_; }
  const LocalFile& file() const { return file_; }
  Strategy strategy() const { return strategy_; }
  CancelToken& cancel_token() { return cancel_; }

private:
  using Notification = std::function<void(SessionObserver&)>;

  struct Pending {
    std::vector<SessionObserver*> observers;
    std::vector<Notification> notifications;
  };

  // All helpers below expect state_mutex_ to be held.
  bool transition_locked(SessionState from, SessionState to, Pending& pending);
  void progress_locked(int value, Pending& pending);
  bool finish_cancelled_locked(Pending& pending);

  void dispatch(Pending& pending);

  // Runs fn(pending) under the state lock, then delivers what it queued.
  // dispatch_mutex_ is taken first so observers see events in the order the
  // state changed.
  template <typename Fn> bool mutate(Fn&& fn) {
    std::lock_guard<std::recursive_mutex> order(dispatch_mutex_);
    Pending pending;
    bool changed = false;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      pending.observers = observers_;
      changed = fn(pending);
    }
    dispatch(pending);
    return changed;
  }

  const std::string id_;
  const LocalFile file_;
  const Strategy strategy_;
  CancelToken cancel_;

  mutable std::mutex state_mutex_;
  std::recursive_mutex dispatch_mutex_;
  SessionState state_ = SessionState::IDLE;
  ProgressTracker tracker_;
  int reported_progress_ = 0;
  uint64_t loaded_rows_ = 0;
  uint64_t loaded_chunks_ = 0;
  std::optional<Error> error_;
  std::optional<MaterializedTable> table_;
  bool ended_ = false;
  bool cancelled_ = false;
  std::vector<SessionObserver*> observers_;
};

} // namespace tabflow
