#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace tabflow {

/// Thread-safe bounded byte pipe between one producer and one consumer.
///
/// The producer write()s frames and blocks while the buffer is full, which
/// gives the stream natural backpressure. The consumer read()s whatever is
/// buffered, blocking until data arrives or the writer closes.
/// close_writer() marks end of input; abort() tears the channel down from the
/// reader side and makes every pending and future write fail.
class ByteChannel {
public:
  explicit ByteChannel(size_t capacity = 256 * 1024) : capacity_(capacity == 0 ? 1 : capacity) {}

  ByteChannel(const ByteChannel&) = delete;
  ByteChannel& operator=(const ByteChannel&) = delete;

  /// Producer: append bytes, blocking while the channel is full.
  /// Writes larger than the capacity are delivered in pieces.
  /// Returns false if the channel was aborted or the writer closed.
  bool write(std::string_view bytes) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!bytes.empty()) {
      not_full_.wait(lock, [this] { return buffered() < capacity_ || aborted_ || writer_closed_; });
      if (aborted_ || writer_closed_)
        return false;
      size_t n = std::min(bytes.size(), capacity_ - buffered());
      buffer_.append(bytes.data(), n);
      bytes.remove_prefix(n);
      not_empty_.notify_all();
    }
    return true;
  }

  /// Consumer: copy up to max_len bytes. Blocks until data is available.
  /// Returns 0 at end of input or after abort().
  size_t read(char* out, size_t max_len) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return buffered() > 0 || writer_closed_ || aborted_; });
    if (aborted_)
      return 0;
    size_t n = std::min(max_len, buffered());
    buffer_.copy(out, n, read_pos_);
    read_pos_ += n;
    if (read_pos_ == buffer_.size()) {
      buffer_.clear();
      read_pos_ = 0;
    } else if (read_pos_ > capacity_) {
      buffer_.erase(0, read_pos_);
      read_pos_ = 0;
    }
    not_full_.notify_all();
    return n;
  }

  /// Signal that no more bytes will be written.
  void close_writer() {
    std::unique_lock<std::mutex> lock(mutex_);
    writer_closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  /// Abandon the channel from the reader side. Unblocks all waiting threads.
  void abort() {
    std::unique_lock<std::mutex> lock(mutex_);
    aborted_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool is_aborted() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return aborted_;
  }

private:
  size_t buffered() const { return buffer_.size() - read_pos_; }

  std::string buffer_;
  size_t read_pos_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;
  bool writer_closed_ = false;
  bool aborted_ = false;
};

} // namespace tabflow
