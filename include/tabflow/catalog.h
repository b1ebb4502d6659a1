#pragma once

#include "error.h"
#include "types.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tabflow {

// Persistent store of file metadata records, keyed by record id.
class Catalog {
public:
  virtual ~Catalog() = default;

  // Fails if a record with the same id already exists.
  virtual Result<void> insert(const FileMetadataRecord& record) = 0;
  virtual std::optional<FileMetadataRecord> find(const std::string& id) const = 0;
  virtual size_t size() const = 0;
};

// Thread-safe in-process catalog.
class MemoryCatalog : public Catalog {
public:
  Result<void> insert(const FileMetadataRecord& record) override;
  std::optional<FileMetadataRecord> find(const std::string& id) const override;
  size_t size() const override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, FileMetadataRecord> records_;
};

// Lower-case base-36 rendering of an unsigned value.
std::string to_base36(uint64_t value);

// Derive an engine-safe table name from an uploaded filename:
// extension stripped, non-alphanumerics replaced with '_', runs collapsed,
// trimmed, prefixed with "t_" unless it starts with a letter, truncated to 50
// characters, then suffixed with "_<unique_suffix>" and lower-cased.
std::string sanitize_table_name(std::string_view filename, std::string_view unique_suffix);

// Random 128-bit identifier as 32 lower-case hex characters.
std::string make_record_id();

// Milliseconds since the Unix epoch.
uint64_t now_millis();

} // namespace tabflow
