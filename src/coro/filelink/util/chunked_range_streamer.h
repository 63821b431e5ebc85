#ifndef CORO_FILELINK_UTIL_CHUNKED_RANGE_STREAMER_H
#define CORO_FILELINK_UTIL_CHUNKED_RANGE_STREAMER_H

#include <cstdint>
#include <string>

#include "coro/filelink/abstract_upstream.h"
#include "coro/filelink/util/file_descriptor.h"
#include "coro/filelink/util/range_planner.h"
#include "coro/generator.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

// Emits the bytes of `range` out of a sequence of blocks which starts at
// offset 0. Blocks before the range are dropped, blocks past its end are never
// pulled. Throws FileLinkException if `blocks` ends before `range` is covered.
Generator<std::string> StreamChunkedRange(Generator<std::string> blocks,
                                          ByteRange range);

class ChunkedRangeStreamer {
 public:
  ChunkedRangeStreamer(const AbstractUpstream* upstream, int64_t chunk_size)
      : upstream_(upstream), chunk_size_(chunk_size) {}

  Generator<std::string> operator()(const FileDescriptor& descriptor,
                                    ByteRange range,
                                    stdx::stop_token stop_token) const;

 private:
  const AbstractUpstream* upstream_;
  int64_t chunk_size_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_CHUNKED_RANGE_STREAMER_H
