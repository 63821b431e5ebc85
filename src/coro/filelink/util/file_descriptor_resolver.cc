#include "coro/filelink/util/file_descriptor_resolver.h"

#include <fmt/format.h>

#include <utility>

#include "coro/filelink/file_link_exception.h"
#include "coro/filelink/util/file_identifier.h"
#include "coro/filelink/util/media_utils.h"
#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

namespace {

using Document = AbstractUpstream::Document;
using Video = AbstractUpstream::Video;
using Audio = AbstractUpstream::Audio;
using Photo = AbstractUpstream::Photo;

std::string GetFallbackName(std::string_view type, std::string_view file_id,
                            std::string_view extension) {
  return StrCat(type, "_", file_id.substr(0, 8), extension);
}

std::string GetName(const std::optional<std::string>& file_name,
                    std::string_view type, std::string_view file_id,
                    std::string_view extension) {
  if (file_name && !file_name->empty()) {
    return *file_name;
  }
  return GetFallbackName(type, file_id, extension);
}

std::string GetMimeType(const std::optional<std::string>& mime_type,
                        std::string_view default_mime_type) {
  if (mime_type && !mime_type->empty()) {
    return *mime_type;
  }
  return std::string(default_mime_type);
}

struct PartialDescriptor {
  std::string upstream_file_id;
  std::string name;
  int64_t size;
  std::string mime_type;
  std::optional<int64_t> duration;
  std::optional<int64_t> width;
  std::optional<int64_t> height;
  std::optional<std::string> performer;
  std::optional<std::string> title;
};

PartialDescriptor Classify(Document d) {
  return PartialDescriptor{
      .upstream_file_id = d.file_id,
      .name = GetName(d.file_name, "document", d.file_id, ""),
      .size = d.file_size,
      .mime_type = GetMimeType(d.mime_type, "application/octet-stream")};
}

PartialDescriptor Classify(Video d) {
  return PartialDescriptor{
      .upstream_file_id = d.file_id,
      .name = GetName(d.file_name, "video", d.file_id, ".mp4"),
      .size = d.file_size,
      .mime_type = GetMimeType(d.mime_type, "video/mp4"),
      .duration = d.duration,
      .width = d.width,
      .height = d.height};
}

PartialDescriptor Classify(Audio d) {
  return PartialDescriptor{
      .upstream_file_id = d.file_id,
      .name = GetName(d.file_name, "audio", d.file_id, ".mp3"),
      .size = d.file_size,
      .mime_type = GetMimeType(d.mime_type, "audio/mpeg"),
      .duration = d.duration,
      .performer = std::move(d.performer),
      .title = std::move(d.title)};
}

PartialDescriptor Classify(Photo d) {
  return PartialDescriptor{
      .upstream_file_id = d.file_id,
      .name = GetFallbackName("photo", d.file_id, ".jpg"),
      .size = d.file_size,
      .mime_type = "image/jpeg",
      .width = d.width,
      .height = d.height};
}

}  // namespace

FileDescriptor ToFileDescriptor(std::string file_id, int64_t container_id,
                                int64_t item_id,
                                AbstractUpstream::MediaKind media,
                                std::optional<int64_t> date) {
  PartialDescriptor d = std::visit(
      [](auto& media) { return Classify(std::move(media)); }, media);
  if (d.size < 0) {
    throw FileLinkException(fmt::format("upstream reported size {} for {}",
                                        d.size, file_id));
  }
  FileCategory category = GetFileCategory(d.name, d.mime_type);
  AbstractUpstream::Locator locator{.container_id = container_id,
                                    .item_id = item_id,
                                    .file_id = std::move(d.upstream_file_id),
                                    .size = d.size};
  return FileDescriptor{.file_id = std::move(file_id),
                        .name = std::move(d.name),
                        .size = d.size,
                        .mime_type = std::move(d.mime_type),
                        .category = category,
                        .streamable = IsStreamable(category),
                        .upstream_locator = std::move(locator),
                        .duration = d.duration,
                        .width = d.width,
                        .height = d.height,
                        .performer = std::move(d.performer),
                        .title = std::move(d.title),
                        .date = date};
}

Task<FileDescriptor> FileDescriptorResolver::operator()(
    std::string file_id, stdx::stop_token stop_token) const {
  auto id = ParseFileIdentifier(file_id);
  if (!id) {
    throw FileLinkException(FileLinkException::Type::kInvalidIdentifier);
  }
  if (auto descriptor = cache_->Get(file_id, clock_->Now())) {
    co_return std::move(*descriptor);
  }
  std::optional<AbstractUpstream::Item> item = co_await upstream_->Lookup(
      id->container_id, id->item_id, std::move(stop_token));
  if (!item || !item->media) {
    throw FileLinkException(FileLinkException::Type::kNotFound);
  }
  FileDescriptor descriptor =
      ToFileDescriptor(file_id, item->container_id, item->item_id,
                       std::move(*item->media), item->date);
  cache_->Put(std::move(file_id), descriptor, clock_->Now());
  co_return descriptor;
}

}  // namespace coro::filelink::util
