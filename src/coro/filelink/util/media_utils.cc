#include "coro/filelink/util/media_utils.h"

#include <fmt/format.h>

#include <array>
#include <span>
#include <utility>

#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

namespace {

struct CategoryData {
  FileCategory category;
  std::span<const std::string_view> extensions;
  std::span<const std::string_view> mime_types;
};

constexpr std::string_view kVideoExtensions[] = {
    ".mp4", ".mkv", ".avi", ".mov", ".webm", ".flv", ".wmv", ".m4v"};
constexpr std::string_view kVideoMimeTypes[] = {
    "video/mp4",  "video/x-matroska", "video/x-msvideo", "video/quicktime",
    "video/webm", "video/x-flv",      "video/x-ms-wmv"};

constexpr std::string_view kAudioExtensions[] = {
    ".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a", ".wma"};
constexpr std::string_view kAudioMimeTypes[] = {
    "audio/mpeg", "audio/wav", "audio/flac",    "audio/aac",
    "audio/ogg",  "audio/mp4", "audio/x-ms-wma"};

constexpr std::string_view kDocumentExtensions[] = {".pdf",  ".doc", ".docx",
                                                    ".txt",  ".rtf", ".odt"};
constexpr std::string_view kDocumentMimeTypes[] = {
    "application/pdf",
    "application/msword",
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
    "text/plain",
    "application/rtf",
    "application/vnd.oasis.opendocument.text"};

constexpr std::string_view kImageExtensions[] = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg"};
constexpr std::string_view kImageMimeTypes[] = {
    "image/jpeg", "image/png",  "image/gif",
    "image/bmp",  "image/webp", "image/svg+xml"};

constexpr CategoryData kCategories[] = {
    {FileCategory::kVideo, kVideoExtensions, kVideoMimeTypes},
    {FileCategory::kAudio, kAudioExtensions, kAudioMimeTypes},
    {FileCategory::kDocument, kDocumentExtensions, kDocumentMimeTypes},
    {FileCategory::kImage, kImageExtensions, kImageMimeTypes}};

constexpr std::pair<std::string_view, std::string_view> kExtensionMimeTypes[] =
    {{".mp4", "video/mp4"},       {".mkv", "video/x-matroska"},
     {".avi", "video/x-msvideo"}, {".mov", "video/quicktime"},
     {".webm", "video/webm"},     {".flv", "video/x-flv"},
     {".wmv", "video/x-ms-wmv"},  {".m4v", "video/x-m4v"},
     {".mp3", "audio/mpeg"},      {".wav", "audio/wav"},
     {".flac", "audio/flac"},     {".aac", "audio/aac"},
     {".ogg", "audio/ogg"},       {".m4a", "audio/mp4"},
     {".wma", "audio/x-ms-wma"},  {".jpg", "image/jpeg"},
     {".jpeg", "image/jpeg"},     {".png", "image/png"},
     {".gif", "image/gif"},       {".webp", "image/webp"},
     {".pdf", "application/pdf"}, {".txt", "text/plain"}};

constexpr std::string_view kMobileIndicators[] = {
    "Mobile",     "Android",    "iPhone",        "iPad",
    "iPod",       "BlackBerry", "Windows Phone", "Opera Mini"};

constexpr std::string_view kSafeFilenameCharacters =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_.() ";

FileCategory GetFileCategoryFromMimePrefix(std::string_view mime_type) {
  if (mime_type.starts_with("audio/")) {
    return FileCategory::kAudio;
  } else if (mime_type.starts_with("image/")) {
    return FileCategory::kImage;
  } else if (mime_type.starts_with("video/")) {
    return FileCategory::kVideo;
  } else {
    return FileCategory::kUnknown;
  }
}

}  // namespace

std::string_view ToString(FileCategory category) {
  switch (category) {
    case FileCategory::kVideo:
      return "video";
    case FileCategory::kAudio:
      return "audio";
    case FileCategory::kDocument:
      return "document";
    case FileCategory::kImage:
      return "image";
    default:
      return "unknown";
  }
}

FileCategory GetFileCategory(std::string_view filename,
                             std::string_view mime_type) {
  std::string filename_lower = ToLower(filename);
  for (const auto& d : kCategories) {
    for (std::string_view extension : d.extensions) {
      if (std::string_view(filename_lower).ends_with(extension)) {
        return d.category;
      }
    }
  }
  if (mime_type.empty()) {
    return FileCategory::kUnknown;
  }
  for (const auto& d : kCategories) {
    for (std::string_view type : d.mime_types) {
      if (type == mime_type) {
        return d.category;
      }
    }
  }
  return GetFileCategoryFromMimePrefix(mime_type);
}

std::optional<std::string_view> GetMimeTypeForExtension(
    std::string_view filename) {
  std::string filename_lower = ToLower(filename);
  for (const auto& [extension, mime_type] : kExtensionMimeTypes) {
    if (std::string_view(filename_lower).ends_with(extension)) {
      return mime_type;
    }
  }
  return std::nullopt;
}

std::string GetStreamingContentType(const FileDescriptor& descriptor) {
  if (!descriptor.streamable) {
    return descriptor.mime_type;
  }
  std::string_view family =
      descriptor.category == FileCategory::kVideo ? "video/" : "audio/";
  if (std::string_view(descriptor.mime_type).starts_with(family)) {
    return descriptor.mime_type;
  }
  if (auto mime_type = GetMimeTypeForExtension(descriptor.name)) {
    return std::string(*mime_type);
  }
  return descriptor.mime_type;
}

std::string FormatFileSize(int64_t size) {
  if (size == 0) {
    return "0 B";
  }
  constexpr std::string_view kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(size);
  size_t i = 0;
  while (value >= 1024 && i + 1 < std::size(kUnits)) {
    value /= 1024.0;
    i++;
  }
  return fmt::format("{:.1f} {}", value, kUnits[i]);
}

std::string GenerateSafeFilename(std::string_view filename) {
  std::string result;
  for (char c : filename) {
    char d = kSafeFilenameCharacters.find(c) == std::string_view::npos ? '_' : c;
    if ((d == '_' || d == ' ') && !result.empty() && result.back() == d) {
      continue;
    }
    result += d;
  }
  size_t begin = result.find_first_not_of("_. ");
  if (begin == std::string::npos) {
    return "unnamed_file";
  }
  size_t end = result.find_last_not_of("_. ");
  return result.substr(begin, end - begin + 1);
}

bool IsMobileUserAgent(std::string_view user_agent) {
  for (std::string_view indicator : kMobileIndicators) {
    if (user_agent.find(indicator) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace coro::filelink::util
