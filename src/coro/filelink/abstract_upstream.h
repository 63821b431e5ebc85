#ifndef CORO_FILELINK_ABSTRACT_UPSTREAM_H
#define CORO_FILELINK_ABSTRACT_UPSTREAM_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "coro/generator.h"
#include "coro/stdx/stop_token.h"
#include "coro/task.h"

namespace coro::filelink {

// Message-based object store holding the files. Items are addressed by
// (container, item) and their content can only be read as a sequence of
// blocks starting at offset 0.
class AbstractUpstream {
 public:
  struct Document {
    std::string file_id;
    std::optional<std::string> file_name;
    int64_t file_size;
    std::optional<std::string> mime_type;
  };

  struct Video {
    std::string file_id;
    std::optional<std::string> file_name;
    int64_t file_size;
    std::optional<std::string> mime_type;
    std::optional<int64_t> duration;
    std::optional<int64_t> width;
    std::optional<int64_t> height;
  };

  struct Audio {
    std::string file_id;
    std::optional<std::string> file_name;
    int64_t file_size;
    std::optional<std::string> mime_type;
    std::optional<int64_t> duration;
    std::optional<std::string> performer;
    std::optional<std::string> title;
  };

  struct Photo {
    std::string file_id;
    int64_t file_size;
    std::optional<int64_t> width;
    std::optional<int64_t> height;
  };

  using MediaKind = std::variant<Document, Video, Audio, Photo>;

  struct Item {
    int64_t container_id;
    int64_t item_id;
    std::optional<MediaKind> media;
    std::optional<int64_t> date;
  };

  // Handle passed back to FetchBlocks. Built by the resolver, treated as
  // opaque everywhere else.
  struct Locator {
    int64_t container_id;
    int64_t item_id;
    std::string file_id;
    int64_t size;
  };

  virtual ~AbstractUpstream() = default;

  // Returns nullopt if the store has no such item.
  virtual Task<std::optional<Item>> Lookup(
      int64_t container_id, int64_t item_id,
      stdx::stop_token stop_token) const = 0;

  // Finite, lazily fetched sequence of blocks of at most `block_size` bytes,
  // starting at offset 0. Destroying the generator cancels the fetch.
  virtual Generator<std::string> FetchBlocks(
      Locator locator, int64_t block_size,
      stdx::stop_token stop_token) const = 0;
};

}  // namespace coro::filelink

#endif  // CORO_FILELINK_ABSTRACT_UPSTREAM_H
