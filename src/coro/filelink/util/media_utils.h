#ifndef CORO_FILELINK_UTIL_MEDIA_UTILS_H
#define CORO_FILELINK_UTIL_MEDIA_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "coro/filelink/util/file_descriptor.h"

namespace coro::filelink::util {

std::string_view ToString(FileCategory category);

// Extension first, then the MIME type.
FileCategory GetFileCategory(std::string_view filename,
                             std::string_view mime_type);

inline bool IsStreamable(FileCategory category) {
  return category == FileCategory::kVideo || category == FileCategory::kAudio;
}

std::optional<std::string_view> GetMimeTypeForExtension(
    std::string_view filename);

// Content-Type for streaming responses. For video and audio a known extension
// wins over a stored type outside of the category's MIME family.
std::string GetStreamingContentType(const FileDescriptor& descriptor);

std::string FormatFileSize(int64_t size);

// Replaces characters outside [A-Za-z0-9-_.() ] with '_', collapses runs of
// '_' and ' ', trims leading and trailing "_. ".
std::string GenerateSafeFilename(std::string_view filename);

bool IsMobileUserAgent(std::string_view user_agent);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_MEDIA_UTILS_H
