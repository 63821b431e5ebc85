#include "coro/filelink/util/file_descriptor_resolver.h"

#include <gtest/gtest.h>

#include <stdexcept>

#include "coro/exception.h"
#include "coro/filelink/file_link_exception.h"
#include "coro/filelink/test/fake_upstream.h"
#include "coro/filelink/test/test_utils.h"

namespace coro::filelink::util {
namespace {

using ::coro::filelink::test::FakeClock;
using ::coro::filelink::test::FakeUpstream;
using ::coro::filelink::test::RunSync;

using Document = AbstractUpstream::Document;
using Video = AbstractUpstream::Video;
using Audio = AbstractUpstream::Audio;
using Photo = AbstractUpstream::Photo;

class FileDescriptorResolverTest : public ::testing::Test {
 protected:
  FileDescriptor Resolve(std::string file_id) {
    return RunSync([&]() -> Task<FileDescriptor> {
      co_return co_await resolver_(file_id, stdx::stop_token());
    });
  }

  FileLinkException::Type GetErrorType(std::string file_id) {
    try {
      Resolve(std::move(file_id));
    } catch (const FileLinkException& e) {
      return e.type();
    }
    throw std::logic_error("resolve succeeded");
  }

  FakeUpstream upstream_;
  FakeClock clock_{1000};
  MetadataCache cache_{/*ttl=*/600};
  FileDescriptorResolver resolver_{&upstream_, &cache_, &clock_};
};

TEST_F(FileDescriptorResolverTest, ResolvesVideo) {
  upstream_.AddItem(-100123, 42,
                    Video{.file_id = "BAACAgIAAxkBAAI",
                          .file_name = "movie.mkv",
                          .file_size = 10'000'000,
                          .mime_type = "video/x-matroska",
                          .duration = 120,
                          .width = 1920,
                          .height = 1080});

  FileDescriptor descriptor = Resolve("-100123_42");

  EXPECT_EQ(descriptor.file_id, "-100123_42");
  EXPECT_EQ(descriptor.name, "movie.mkv");
  EXPECT_EQ(descriptor.size, 10'000'000);
  EXPECT_EQ(descriptor.mime_type, "video/x-matroska");
  EXPECT_EQ(descriptor.category, FileCategory::kVideo);
  EXPECT_TRUE(descriptor.streamable);
  EXPECT_EQ(descriptor.duration, 120);
  EXPECT_EQ(descriptor.width, 1920);
  EXPECT_EQ(descriptor.height, 1080);
  EXPECT_EQ(descriptor.date, 1700000000);
  EXPECT_EQ(descriptor.upstream_locator.container_id, -100123);
  EXPECT_EQ(descriptor.upstream_locator.item_id, 42);
  EXPECT_EQ(descriptor.upstream_locator.file_id, "BAACAgIAAxkBAAI");
  EXPECT_EQ(descriptor.upstream_locator.size, 10'000'000);
}

TEST_F(FileDescriptorResolverTest, FillsInMissingNamesAndTypes) {
  upstream_.AddItem(1, 1, Document{.file_id = "document-id", .file_size = 1});
  upstream_.AddItem(1, 2,
                    Video{.file_id = "video-id", .file_name = "", .file_size = 2});
  upstream_.AddItem(1, 3, Audio{.file_id = "audio-id", .file_size = 3});
  upstream_.AddItem(1, 4, Photo{.file_id = "photo-id-long", .file_size = 4});

  FileDescriptor document = Resolve("1_1");
  EXPECT_EQ(document.name, "document_document");
  EXPECT_EQ(document.mime_type, "application/octet-stream");
  EXPECT_EQ(document.category, FileCategory::kUnknown);
  EXPECT_FALSE(document.streamable);

  FileDescriptor video = Resolve("1_2");
  EXPECT_EQ(video.name, "video_video-id.mp4");
  EXPECT_EQ(video.mime_type, "video/mp4");
  EXPECT_EQ(video.category, FileCategory::kVideo);

  FileDescriptor audio = Resolve("1_3");
  EXPECT_EQ(audio.name, "audio_audio-id.mp3");
  EXPECT_EQ(audio.mime_type, "audio/mpeg");
  EXPECT_EQ(audio.category, FileCategory::kAudio);
  EXPECT_TRUE(audio.streamable);

  FileDescriptor photo = Resolve("1_4");
  EXPECT_EQ(photo.name, "photo_photo-id.jpg");
  EXPECT_EQ(photo.mime_type, "image/jpeg");
  EXPECT_EQ(photo.category, FileCategory::kImage);
  EXPECT_FALSE(photo.streamable);
}

TEST_F(FileDescriptorResolverTest, ExtensionDecidesCategory) {
  upstream_.AddItem(1, 1,
                    Document{.file_id = "id",
                             .file_name = "clip.MP4",
                             .file_size = 1,
                             .mime_type = "application/octet-stream"});

  FileDescriptor descriptor = Resolve("1_1");

  EXPECT_EQ(descriptor.category, FileCategory::kVideo);
  EXPECT_TRUE(descriptor.streamable);
}

TEST_F(FileDescriptorResolverTest, ServesFromCacheWithinTtl) {
  upstream_.AddItem(1, 1, Document{.file_id = "id", .file_size = 1});

  Resolve("1_1");
  clock_.Advance(599);
  Resolve("1_1");

  EXPECT_EQ(upstream_.lookup_count(), 1);
  EXPECT_EQ(cache_.size(), 1);
}

TEST_F(FileDescriptorResolverTest, RefreshesStaleEntry) {
  upstream_.AddItem(1, 1, Document{.file_id = "id", .file_size = 1});

  Resolve("1_1");
  clock_.Advance(600);
  upstream_.AddItem(1, 1, Document{.file_id = "id", .file_size = 2});
  FileDescriptor descriptor = Resolve("1_1");

  EXPECT_EQ(upstream_.lookup_count(), 2);
  EXPECT_EQ(descriptor.size, 2);
}

TEST_F(FileDescriptorResolverTest, CachedEntryOutlivesUpstreamItem) {
  upstream_.AddItem(1, 1, Document{.file_id = "id", .file_size = 1});

  Resolve("1_1");
  upstream_.RemoveItem(1, 1);

  EXPECT_EQ(Resolve("1_1").size, 1);
  clock_.Advance(600);
  EXPECT_EQ(GetErrorType("1_1"), FileLinkException::Type::kNotFound);
}

TEST_F(FileDescriptorResolverTest, MissingItemIsNotFound) {
  EXPECT_EQ(GetErrorType("1_1"), FileLinkException::Type::kNotFound);
  EXPECT_EQ(cache_.size(), 0);
}

TEST_F(FileDescriptorResolverTest, ItemWithoutMediaIsNotFound) {
  upstream_.AddItem(1, 1, std::nullopt);

  EXPECT_EQ(GetErrorType("1_1"), FileLinkException::Type::kNotFound);
}

TEST_F(FileDescriptorResolverTest, RejectsMalformedIdentifier) {
  for (const char* file_id :
       {"", "1", "1_", "_1", "1_2_3", "a_b", "1_2x", "1:2",
        "99999999999999999999_1"}) {
    EXPECT_EQ(GetErrorType(file_id),
              FileLinkException::Type::kInvalidIdentifier)
        << file_id;
  }
  EXPECT_EQ(upstream_.lookup_count(), 0);
}

TEST_F(FileDescriptorResolverTest, PropagatesUpstreamFailure) {
  upstream_.FailLookups(true);

  EXPECT_THROW(Resolve("1_1"), RuntimeError);
  EXPECT_EQ(cache_.size(), 0);
}

TEST_F(FileDescriptorResolverTest, RejectsNegativeSize) {
  upstream_.AddItem(1, 1, Document{.file_id = "id", .file_size = -5});

  EXPECT_EQ(GetErrorType("1_1"), FileLinkException::Type::kUnknown);
  EXPECT_EQ(cache_.size(), 0);
}

}  // namespace
}  // namespace coro::filelink::util
