#include "coro/filelink/util/metadata_cache.h"

#include <utility>

namespace coro::filelink::util {

std::optional<FileDescriptor> MetadataCache::Get(const std::string& file_id,
                                                 int64_t now) const {
  auto it = entries_.find(file_id);
  if (it == entries_.end() || now - it->second.resolved_at >= ttl_) {
    return std::nullopt;
  }
  return it->second.descriptor;
}

void MetadataCache::Put(std::string file_id, FileDescriptor descriptor,
                        int64_t now) {
  entries_.insert_or_assign(
      std::move(file_id),
      Entry{.descriptor = std::move(descriptor), .resolved_at = now});
}

}  // namespace coro::filelink::util
