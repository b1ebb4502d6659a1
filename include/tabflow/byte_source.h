#pragma once

#include "error.h"

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace tabflow {

// Sequential byte input. Implementations may return fewer bytes than requested
// at any point; only a zero-length read means end of input.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual Result<size_t> read(char* buffer, size_t max_len) = 0;
};

// In-memory source. max_read caps the bytes returned per call (0 = no cap),
// which lets tests reproduce arbitrarily fragmented network reads.
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string data, size_t max_read = 0)
      : data_(std::move(data)), max_read_(max_read) {}

  Result<size_t> read(char* buffer, size_t max_len) override;

  size_t remaining() const { return data_.size() - pos_; }

private:
  std::string data_;
  size_t pos_ = 0;
  size_t max_read_;
};

// Reads a file on disk through stdio.
class FileByteSource : public ByteSource {
public:
  static Result<std::unique_ptr<FileByteSource>> open(const std::string& path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  Result<size_t> read(char* buffer, size_t max_len) override;

  const std::string& path() const { return path_; }

private:
  FileByteSource(FILE* file, std::string path) : file_(file), path_(std::move(path)) {}

  FILE* file_;
  std::string path_;
};

// Drain a source into a string. Fails if more than max_bytes would be read.
Result<std::string> read_all(ByteSource& source, size_t max_bytes);

} // namespace tabflow
