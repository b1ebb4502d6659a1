#include "tabflow/byte_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace tabflow {

Result<size_t> MemoryByteSource::read(char* buffer, size_t max_len) {
  size_t n = std::min(max_len, data_.size() - pos_);
  if (max_read_ > 0)
    n = std::min(n, max_read_);
  std::memcpy(buffer, data_.data() + pos_, n);
  pos_ += n;
  return Result<size_t>::success(std::move(n));
}

Result<std::unique_ptr<FileByteSource>> FileByteSource::open(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    return Result<std::unique_ptr<FileByteSource>>::failure(
        Error::upload(std::string("cannot open file: ") + std::strerror(errno), path));
  }
  return Result<std::unique_ptr<FileByteSource>>::success(
      std::unique_ptr<FileByteSource>(new FileByteSource(file, path)));
}

FileByteSource::~FileByteSource() {
  if (file_)
    std::fclose(file_);
}

Result<size_t> FileByteSource::read(char* buffer, size_t max_len) {
  size_t n = std::fread(buffer, 1, max_len, file_);
  if (n < max_len && std::ferror(file_)) {
    return Result<size_t>::failure(Error::upload("read error", path_));
  }
  return Result<size_t>::success(std::move(n));
}

Result<std::string> read_all(ByteSource& source, size_t max_bytes) {
  std::string out;
  char buffer[64 * 1024];
  while (true) {
    auto r = source.read(buffer, sizeof(buffer));
    if (!r)
      return Result<std::string>::failure(r.error);
    if (r.value == 0)
      break;
    if (out.size() + r.value > max_bytes) {
      return Result<std::string>::failure(
          Error::stream("input exceeds " + std::to_string(max_bytes) + " bytes"));
    }
    out.append(buffer, r.value);
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace tabflow
