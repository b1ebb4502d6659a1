#include "tabflow/catalog.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <random>

namespace tabflow {

Result<void> MemoryCatalog::insert(const FileMetadataRecord& record) {
  if (record.id.empty())
    return Result<void>::failure(Error::metadata("record id must not be empty"));
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = records_.emplace(record.id, record);
  if (!inserted)
    return Result<void>::failure(Error::metadata("duplicate record id", record.id));
  return Result<void>::success();
}

std::optional<FileMetadataRecord> MemoryCatalog::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

size_t MemoryCatalog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::string to_base36(uint64_t value) {
  static constexpr char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (value == 0)
    return "0";
  std::string out;
  while (value > 0) {
    out += DIGITS[value % 36];
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string sanitize_table_name(std::string_view filename, std::string_view unique_suffix) {
  size_t dot = filename.rfind('.');
  if (dot != std::string_view::npos && dot > 0)
    filename = filename.substr(0, dot);

  std::string name;
  name.reserve(filename.size());
  for (char c : filename) {
    bool alnum = std::isalnum(static_cast<unsigned char>(c)) != 0;
    char mapped = alnum ? c : '_';
    if (mapped == '_' && !name.empty() && name.back() == '_')
      continue;
    name += mapped;
  }

  size_t begin = name.find_first_not_of('_');
  if (begin == std::string::npos) {
    name.clear();
  } else {
    size_t end = name.find_last_not_of('_');
    name = name.substr(begin, end - begin + 1);
  }

  if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0])))
    name = "t_" + name;
  if (name.size() > 50)
    name.resize(50);
  while (!name.empty() && name.back() == '_')
    name.pop_back();

  if (!unique_suffix.empty()) {
    name += '_';
    name.append(unique_suffix.data(), unique_suffix.size());
  }
  for (auto& c : name)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

std::string make_record_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx", static_cast<unsigned long long>(rng()),
                static_cast<unsigned long long>(rng()));
  return std::string(buf, 32);
}

uint64_t now_millis() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

} // namespace tabflow
