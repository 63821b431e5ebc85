#ifndef CORO_FILELINK_UTIL_FILE_DESCRIPTOR_RESOLVER_H
#define CORO_FILELINK_UTIL_FILE_DESCRIPTOR_RESOLVER_H

#include <optional>
#include <string>

#include "coro/filelink/abstract_upstream.h"
#include "coro/filelink/util/clock.h"
#include "coro/filelink/util/file_descriptor.h"
#include "coro/filelink/util/metadata_cache.h"
#include "coro/stdx/stop_token.h"
#include "coro/task.h"

namespace coro::filelink::util {

// Classifies an upstream item carrying media into a descriptor. Missing names
// and MIME types are replaced with type-specific defaults. Throws
// FileLinkException if the upstream reports a negative size.
FileDescriptor ToFileDescriptor(std::string file_id,
                                int64_t container_id, int64_t item_id,
                                AbstractUpstream::MediaKind media,
                                std::optional<int64_t> date);

class FileDescriptorResolver {
 public:
  FileDescriptorResolver(const AbstractUpstream* upstream, MetadataCache* cache,
                         const Clock* clock)
      : upstream_(upstream), cache_(cache), clock_(clock) {}

  // Throws FileLinkException of type kInvalidIdentifier or kNotFound. Upstream
  // errors propagate as they are.
  Task<FileDescriptor> operator()(std::string file_id,
                                  stdx::stop_token stop_token) const;

 private:
  const AbstractUpstream* upstream_;
  MetadataCache* cache_;
  const Clock* clock_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_DESCRIPTOR_RESOLVER_H
