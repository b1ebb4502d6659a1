#include "tabflow/ingest_session.h"

#include <algorithm>

namespace tabflow {

IngestSession::IngestSession(std::string id, LocalFile file, Strategy strategy,
                             const ProgressOptions& progress)
    : id_(std::move(id)), file_(std::move(file)), strategy_(strategy), tracker_(progress) {}

void IngestSession::subscribe(SessionObserver* observer) {
  if (!observer)
    return;
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    observers_.push_back(observer);
}

void IngestSession::unsubscribe(SessionObserver* observer) {
  std::lock_guard<std::recursive_mutex> order(dispatch_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

bool IngestSession::transition_locked(SessionState from, SessionState to, Pending& pending) {
  if (ended_ || state_ != from)
    return false;
  state_ = to;
  pending.notifications.push_back(
      [this, from, to](SessionObserver& o) { o.on_state_changed(id_, from, to); });
  return true;
}

void IngestSession::progress_locked(int value, Pending& pending) {
  if (value <= reported_progress_)
    return;
  reported_progress_ = value;
  pending.notifications.push_back([this, value](SessionObserver& o) { o.on_progress(id_, value); });
}

bool IngestSession::finish_cancelled_locked(Pending& pending) {
  if (ended_)
    return false;
  ended_ = true;
  cancelled_ = true;
  error_ = Error::cancelled();
  SessionState from = state_;
  state_ = SessionState::IDLE;
  if (from != SessionState::IDLE)
    pending.notifications.push_back([this, from](SessionObserver& o) {
      o.on_state_changed(id_, from, SessionState::IDLE);
    });
  Error err = *error_;
  pending.notifications.push_back([this, err](SessionObserver& o) { o.on_error(id_, err); });
  return true;
}

void IngestSession::dispatch(Pending& pending) {
  for (const auto& notify : pending.notifications)
    for (SessionObserver* observer : pending.observers)
      notify(*observer);
}

bool IngestSession::begin_upload() {
  return mutate([&](Pending& pending) {
    return transition_locked(SessionState::IDLE, SessionState::UPLOADING, pending);
  });
}

void IngestSession::report_upload(int percent) {
  std::lock_guard<std::recursive_mutex> order(dispatch_mutex_);
  Pending pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (ended_ || state_ != SessionState::UPLOADING)
      return;
    pending.observers = observers_;
    progress_locked(tracker_.on_upload(percent), pending);
  }
  dispatch(pending);
}

bool IngestSession::begin_processing() {
  return mutate([&](Pending& pending) {
    if (!transition_locked(SessionState::UPLOADING, SessionState::PROCESSING, pending))
      return false;
    progress_locked(tracker_.on_upload(100), pending);
    return true;
  });
}

void IngestSession::report_metadata() {
  std::lock_guard<std::recursive_mutex> order(dispatch_mutex_);
  Pending pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (ended_ || state_ != SessionState::PROCESSING)
      return;
    pending.observers = observers_;
    progress_locked(tracker_.on_metadata(), pending);
  }
  dispatch(pending);
}

void IngestSession::report_chunk(uint64_t chunk_index, uint64_t loaded_rows,
                                 uint64_t row_estimate) {
  std::lock_guard<std::recursive_mutex> order(dispatch_mutex_);
  Pending pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (ended_ || state_ != SessionState::PROCESSING)
      return;
    pending.observers = observers_;
    loaded_chunks_ = chunk_index + 1;
    loaded_rows_ = loaded_rows;
    pending.notifications.push_back([this, chunk_index, loaded_rows](SessionObserver& o) {
      o.on_chunk_loaded(id_, chunk_index, loaded_rows);
    });
    progress_locked(tracker_.on_rows(loaded_rows, row_estimate), pending);
  }
  dispatch(pending);
}

void IngestSession::report_loaded(uint64_t rows) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (ended_)
    return;
  loaded_rows_ = rows;
  loaded_chunks_ = 1;
}

bool IngestSession::complete(const MaterializedTable& table) {
  return mutate([&](Pending& pending) {
    if (ended_ || state_ != SessionState::PROCESSING)
      return false;
    // 100 and Complete become visible together.
    progress_locked(tracker_.on_complete(), pending);
    transition_locked(SessionState::PROCESSING, SessionState::COMPLETE, pending);
    ended_ = true;
    table_ = table;
    loaded_rows_ = table.row_count;
    pending.notifications.push_back(
        [this, table](SessionObserver& o) { o.on_complete(id_, table); });
    return true;
  });
}

bool IngestSession::fail(const Error& error) {
  return mutate([&](Pending& pending) {
    if (error.is_cancellation())
      return finish_cancelled_locked(pending);
    if (ended_)
      return false;
    SessionState from = state_;
    state_ = SessionState::FAILED;
    ended_ = true;
    error_ = error;
    pending.notifications.push_back([this, from](SessionObserver& o) {
      o.on_state_changed(id_, from, SessionState::FAILED);
    });
    pending.notifications.push_back([this, error](SessionObserver& o) { o.on_error(id_, error); });
    return true;
  });
}

bool IngestSession::cancel() {
  if (ended())
    return false;
  // Aborts the in-flight stream and waits for a running engine call.
  cancel_.request();
  return mutate([&](Pending& pending) { return finish_cancelled_locked(pending); });
}

SessionSnapshot IngestSession::snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  SessionSnapshot snap;
  snap.id = id_;
  snap.filename = file_.name;
  snap.strategy = strategy_;
  snap.state = state_;
  snap.progress = reported_progress_;
  snap.loaded_rows = loaded_rows_;
  snap.loaded_chunks = loaded_chunks_;
  snap.error = error_;
  snap.table = table_;
  snap.cancelled = cancelled_;
  return snap;
}

SessionState IngestSession::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

int IngestSession::progress() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return reported_progress_;
}

bool IngestSession::ended() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return ended_;
}

} // namespace tabflow
