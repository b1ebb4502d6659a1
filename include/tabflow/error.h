#ifndef TABFLOW_ERROR_H
#define TABFLOW_ERROR_H

#include <string>
#include <utility>

/**
 * @file error.h
 * @brief Error values shared by every stage of the ingestion pipeline.
 *
 * Stages never throw across the public API. Each operation that can fail returns
 * a Result<T> carrying either a value or an Error tagged with the stage that
 * produced it, so a session can terminate with a precise, typed cause.
 */

namespace tabflow {

/**
 * @brief Stage that produced an error.
 *
 * The session maps every kind except CANCELLED to the Error state;
 * CANCELLED returns the session to Idle.
 */
enum class ErrorKind {
  NONE = 0,        ///< No error
  UPLOAD,          ///< Blob transfer failed (I/O, quota, path rejected)
  METADATA,        ///< Header/sample could not be parsed or the record not persisted
  STREAM,          ///< Malformed frame, row, or out-of-order event
  MATERIALIZATION, ///< The table engine rejected a create or append
  CANCELLED        ///< The user cancelled the session
};

/// Convert an error kind to its display name.
inline const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NONE:
    return "NONE";
  case ErrorKind::UPLOAD:
    return "UPLOAD_ERROR";
  case ErrorKind::METADATA:
    return "METADATA_ERROR";
  case ErrorKind::STREAM:
    return "STREAM_ERROR";
  case ErrorKind::MATERIALIZATION:
    return "MATERIALIZATION_ERROR";
  case ErrorKind::CANCELLED:
    return "CANCELLATION_ERROR";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief A typed pipeline error.
 *
 * `context` carries optional location detail (a storage path, a chunk index,
 * a line number) and is appended in parentheses by to_string().
 */
struct Error {
  ErrorKind kind = ErrorKind::NONE;
  std::string message;
  std::string context;

  Error() = default;
  Error(ErrorKind k, std::string msg, std::string ctx = "")
      : kind(k), message(std::move(msg)), context(std::move(ctx)) {}

  bool is_cancellation() const { return kind == ErrorKind::CANCELLED; }

  /// Format as "KIND: message (context)".
  std::string to_string() const {
    std::string out = error_kind_name(kind);
    out += ": ";
    out += message;
    if (!context.empty()) {
      out += " (";
      out += context;
      out += ")";
    }
    return out;
  }

  static Error upload(std::string msg, std::string ctx = "") {
    return {ErrorKind::UPLOAD, std::move(msg), std::move(ctx)};
  }
  static Error metadata(std::string msg, std::string ctx = "") {
    return {ErrorKind::METADATA, std::move(msg), std::move(ctx)};
  }
  static Error stream(std::string msg, std::string ctx = "") {
    return {ErrorKind::STREAM, std::move(msg), std::move(ctx)};
  }
  static Error materialization(std::string msg, std::string ctx = "") {
    return {ErrorKind::MATERIALIZATION, std::move(msg), std::move(ctx)};
  }
  static Error cancelled(std::string msg = "Upload cancelled by user") {
    return {ErrorKind::CANCELLED, std::move(msg), ""};
  }
};

// Result type for operations that can fail
template <typename T> struct Result {
  T value{};
  Error error;
  bool ok = true;

  static Result success(T&& val) { return {std::move(val), Error(), true}; }
  static Result failure(Error err) { return {T{}, std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

// Specialization for void result (operations that succeed or fail with no value)
template <> struct Result<void> {
  Error error;
  bool ok = true;

  static Result success() { return {Error(), true}; }
  static Result failure(Error err) { return {std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

/**
 * @brief How the frame decoder reacts to a frame it cannot parse.
 */
enum class ErrorMode {
  FAIL_FAST, ///< Escalate the first malformed frame as a STREAM error (default)
  PERMISSIVE ///< Drop the malformed frame, log a warning and keep decoding
};

} // namespace tabflow

#endif // TABFLOW_ERROR_H
