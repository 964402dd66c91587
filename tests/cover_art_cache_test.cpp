#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace mirror_for_plex;
using ::testing::_;
using ::testing::Return;
using services::CoverArtCache;
using services::NetworkError;
using test::MockHttpClient;
using test::TempDir;

namespace {

using DownloadResult = std::expected<void, NetworkError>;

core::FolderIdentity identity_with_cover() {
    core::FolderIdentity identity;
    identity.folder_path = "/mnt/anime/Frieren";
    identity.source_id = "154587";
    identity.catalog = "anilist";
    identity.image_url = "https://img.anilist.co/154587.jpg";
    identity.image_file_name = CoverArtCache::image_file_name("anilist", "154587");
    return identity;
}

} // namespace

TEST(CoverArtCacheTest, FileNameCombinesCatalogAndId) {
    EXPECT_EQ(CoverArtCache::image_file_name("anilist", "154587"), "anilist_154587.jpg");
    EXPECT_EQ(CoverArtCache::image_file_name("tvdb", ""), "");
    EXPECT_EQ(CoverArtCache::image_file_name("", "1"), "");
}

TEST(CoverArtCacheTest, DownloadsIntoThumbsDirectory) {
    TempDir dir;
    auto http = std::make_shared<MockHttpClient>();
    const auto expected_path = dir / "thumbs" / "anilist_154587.jpg";
    EXPECT_CALL(*http, download_file("https://img.anilist.co/154587.jpg", expected_path, std::chrono::seconds(6)))
        .WillOnce([](const std::string&, const std::filesystem::path& path, std::chrono::seconds) {
            std::ofstream(path) << "jpeg bytes";
            return DownloadResult{};
        });

    CoverArtCache cache(http, dir / "thumbs", std::chrono::seconds(6));
    auto image = cache.ensure_image(identity_with_cover());

    ASSERT_TRUE(image);
    EXPECT_EQ(*image, expected_path);
    EXPECT_TRUE(std::filesystem::is_directory(dir / "thumbs"));
    EXPECT_EQ(cache.path_for("anilist_154587.jpg"), expected_path);
}

TEST(CoverArtCacheTest, ExistingCoverIsNotDownloadedAgain) {
    TempDir dir;
    dir.write_file("thumbs/anilist_154587.jpg", "jpeg bytes");
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, download_file(_, _, _)).Times(0);

    CoverArtCache cache(http, dir / "thumbs", std::chrono::seconds(6));

    ASSERT_TRUE(cache.ensure_image(identity_with_cover()));
}

TEST(CoverArtCacheTest, EmptyLeftoverIsReplaced) {
    TempDir dir;
    dir.write_file("thumbs/anilist_154587.jpg", "");
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, download_file(_, _, _)).WillOnce(Return(DownloadResult{}));

    CoverArtCache cache(http, dir / "thumbs", std::chrono::seconds(6));

    EXPECT_TRUE(cache.ensure_image(identity_with_cover()));
}

TEST(CoverArtCacheTest, IdentityWithoutCoverIsNoMatch) {
    TempDir dir;
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, download_file(_, _, _)).Times(0);
    CoverArtCache cache(http, dir / "thumbs", std::chrono::seconds(6));

    auto identity = identity_with_cover();
    identity.image_url.clear();

    auto image = cache.ensure_image(identity);
    ASSERT_FALSE(image);
    EXPECT_EQ(image.error(), core::SyncError::NoMatchFound);
}

TEST(CoverArtCacheTest, DownloadFailuresAreMapped) {
    TempDir dir;
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, download_file(_, _, _))
        .WillOnce(Return(DownloadResult{std::unexpected(NetworkError::Timeout)}))
        .WillOnce(Return(DownloadResult{std::unexpected(NetworkError::FileError)}));

    CoverArtCache cache(http, dir / "thumbs", std::chrono::seconds(6));

    auto timed_out = cache.ensure_image(identity_with_cover());
    ASSERT_FALSE(timed_out);
    EXPECT_EQ(timed_out.error(), core::SyncError::TransientNetworkError);

    auto unwritable = cache.ensure_image(identity_with_cover());
    ASSERT_FALSE(unwritable);
    EXPECT_EQ(unwritable.error(), core::SyncError::CacheWriteFailed);
}

TEST(CoverArtCacheTest, UncreatableThumbsDirectoryFails) {
    TempDir dir;
    dir.write_file("blocker", "");
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, download_file(_, _, _)).Times(0);

    CoverArtCache cache(http, dir / "blocker" / "thumbs", std::chrono::seconds(6));
    auto image = cache.ensure_image(identity_with_cover());

    ASSERT_FALSE(image);
    EXPECT_EQ(image.error(), core::SyncError::CacheWriteFailed);
}
