#include "coro/filelink/util/chunked_range_streamer.h"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "coro/filelink/file_link_exception.h"

namespace coro::filelink::util {

Generator<std::string> StreamChunkedRange(Generator<std::string> blocks,
                                          ByteRange range) {
  int64_t pos = 0;
  int64_t remaining = range.size();
  FOR_CO_AWAIT(std::string & block, blocks) {
    auto length = static_cast<int64_t>(block.size());
    if (pos > range.end) {
      break;
    }
    if (pos + length > range.start) {
      int64_t begin = std::max<int64_t>(0, range.start - pos);
      int64_t end = std::min<int64_t>(length, range.end - pos + 1);
      if (end > begin) {
        remaining -= end - begin;
        if (begin == 0 && end == length) {
          co_yield std::move(block);
        } else {
          co_yield block.substr(begin, end - begin);
        }
      }
    }
    pos += length;
    if (remaining == 0) {
      break;
    }
  }
  if (remaining > 0) {
    throw FileLinkException(
        fmt::format("upstream ended at offset {}, {} bytes short of {}-{}",
                    pos, remaining, range.start, range.end));
  }
}

Generator<std::string> ChunkedRangeStreamer::operator()(
    const FileDescriptor& descriptor, ByteRange range,
    stdx::stop_token stop_token) const {
  return StreamChunkedRange(
      upstream_->FetchBlocks(descriptor.upstream_locator, chunk_size_,
                             std::move(stop_token)),
      range);
}

}  // namespace coro::filelink::util
