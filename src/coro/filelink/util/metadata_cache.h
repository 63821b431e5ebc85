#ifndef CORO_FILELINK_UTIL_METADATA_CACHE_H
#define CORO_FILELINK_UTIL_METADATA_CACHE_H

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "coro/filelink/util/file_descriptor.h"

namespace coro::filelink::util {

// In-memory map from file id to the descriptor resolved for it. An entry is
// stale once `now - resolved_at >= ttl`; stale entries are never evicted, only
// overwritten by the next Put for the same id.
//
// Accessed only from the event loop thread.
class MetadataCache {
 public:
  explicit MetadataCache(int64_t ttl) : ttl_(ttl) {}

  std::optional<FileDescriptor> Get(const std::string& file_id,
                                    int64_t now) const;
  void Put(std::string file_id, FileDescriptor descriptor, int64_t now);

  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    FileDescriptor descriptor;
    int64_t resolved_at;
  };

  int64_t ttl_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_METADATA_CACHE_H
