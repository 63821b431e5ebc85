#include "coro/filelink/test/fake_upstream.h"

#include <algorithm>
#include <variant>

#include "coro/exception.h"

namespace coro::filelink::test {

void FakeUpstream::AddItem(int64_t container_id, int64_t item_id,
                           std::optional<MediaKind> media,
                           std::string content) {
  if (media) {
    std::string file_id =
        std::visit([](const auto& d) { return d.file_id; }, *media);
    contents_.insert_or_assign(std::move(file_id), std::move(content));
  }
  items_.insert_or_assign(std::make_pair(container_id, item_id),
                          Item{.container_id = container_id,
                               .item_id = item_id,
                               .media = std::move(media),
                               .date = 1700000000});
}

void FakeUpstream::RemoveItem(int64_t container_id, int64_t item_id) {
  items_.erase(std::make_pair(container_id, item_id));
}

auto FakeUpstream::Lookup(int64_t container_id, int64_t item_id,
                          stdx::stop_token) const
    -> Task<std::optional<Item>> {
  lookup_count_++;
  if (fail_lookups_) {
    throw RuntimeError("lookup failed");
  }
  auto it = items_.find(std::make_pair(container_id, item_id));
  if (it == items_.end()) {
    co_return std::nullopt;
  }
  co_return it->second;
}

Generator<std::string> FakeUpstream::FetchBlocks(Locator locator,
                                                 int64_t block_size,
                                                 stdx::stop_token) const {
  fetch_count_++;
  last_block_size_ = block_size;
  auto it = contents_.find(locator.file_id);
  if (it == contents_.end()) {
    throw RuntimeError("no content");
  }
  const std::string& content = it->second;
  int64_t pulled = 0;
  for (size_t offset = 0; offset < content.size();
       offset += static_cast<size_t>(block_size)) {
    if (truncate_blocks_after_ && pulled == *truncate_blocks_after_) {
      co_return;
    }
    if (fail_blocks_after_ && pulled == *fail_blocks_after_) {
      throw RuntimeError("block fetch failed");
    }
    pulled++;
    pulled_block_count_++;
    co_yield content.substr(offset, static_cast<size_t>(block_size));
  }
}

}  // namespace coro::filelink::test
