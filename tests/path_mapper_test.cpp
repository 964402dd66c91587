#include "mirror_for_plex/core/path_mapper.hpp"

#include <gtest/gtest.h>

using mirror_for_plex::core::PathMapper;
using mirror_for_plex::core::PathMapping;

TEST(PathMapperTest, ReplacesMatchingPrefix) {
    PathMapper mapper(std::vector<PathMapping>{{"/data/anime", "/mnt/nas/anime"}});

    auto mapped = mapper.map("/data/anime/Frieren/Season 1/Frieren - 01.mkv");

    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(*mapped, "/mnt/nas/anime/Frieren/Season 1/Frieren - 01.mkv");
}

TEST(PathMapperTest, MatchesWholeComponentsOnly) {
    PathMapper mapper(std::vector<PathMapping>{{"/data/anime", "/mnt/anime"}});

    EXPECT_FALSE(mapper.map("/data/anime2/Show/ep.mkv").has_value());
    EXPECT_FALSE(mapper.map("/other/ep.mkv").has_value());
    EXPECT_FALSE(mapper.map("").has_value());
}

TEST(PathMapperTest, IgnoresTrailingSlashesInConfig) {
    PathMapper mapper(std::vector<PathMapping>{{"/data/anime/", "/mnt/anime/"}});

    EXPECT_EQ(mapper.map("/data/anime/Show/ep.mkv").value_or(""), "/mnt/anime/Show/ep.mkv");
}

TEST(PathMapperTest, ConvertsWindowsSeparators) {
    PathMapper mapper(std::vector<PathMapping>{{"D:\\Media\\Anime", "/mnt/anime"}});

    EXPECT_EQ(mapper.map("D:\\Media\\Anime\\Show\\ep.mkv").value_or(""), "/mnt/anime/Show/ep.mkv");
}

TEST(PathMapperTest, FirstMatchingMappingWins) {
    PathMapper mapper(std::vector<PathMapping>{{"/data", "/a"}, {"/data/anime", "/b"}});

    EXPECT_EQ(mapper.map("/data/anime/ep.mkv").value_or(""), "/a/anime/ep.mkv");
}

TEST(PathMapperTest, RootMappings) {
    PathMapper to_mount(std::vector<PathMapping>{{"/", "/mnt/server"}});
    EXPECT_EQ(to_mount.map("/data/ep.mkv").value_or(""), "/mnt/server/data/ep.mkv");

    PathMapper from_mount(std::vector<PathMapping>{{"/mnt/server", "/"}});
    EXPECT_EQ(from_mount.map("/mnt/server/data/ep.mkv").value_or(""), "/data/ep.mkv");
}

TEST(PathMapperTest, WithoutMappingsPathsPassThrough) {
    PathMapper mapper;

    EXPECT_TRUE(mapper.empty());
    EXPECT_EQ(mapper.map("/data/anime/ep.mkv").value_or(""), "/data/anime/ep.mkv");
}

TEST(PathMapperTest, EmptyRemotePrefixIsDropped) {
    PathMapper mapper(std::vector<PathMapping>{{"", "/mnt"}});
    EXPECT_TRUE(mapper.empty());
}

TEST(PathMapperTest, RecognizesSeasonDirectories) {
    EXPECT_TRUE(PathMapper::is_season_directory("Season 1"));
    EXPECT_TRUE(PathMapper::is_season_directory("season_02"));
    EXPECT_TRUE(PathMapper::is_season_directory("S3"));
    EXPECT_TRUE(PathMapper::is_season_directory("Specials"));
    EXPECT_FALSE(PathMapper::is_season_directory("Seasons"));
    EXPECT_FALSE(PathMapper::is_season_directory("Frieren"));
    EXPECT_FALSE(PathMapper::is_season_directory("Attack on Titan S4"));
}

TEST(PathMapperTest, IdentityFolderSkipsSeasonDirectory) {
    EXPECT_EQ(PathMapper::identity_folder("/mnt/anime/Frieren/Season 1/ep01.mkv"),
              std::filesystem::path("/mnt/anime/Frieren"));
    EXPECT_EQ(PathMapper::identity_folder("/mnt/anime/Attack on Titan S4/ep01.mkv"),
              std::filesystem::path("/mnt/anime/Attack on Titan S4"));
    EXPECT_EQ(PathMapper::identity_folder("/mnt/movies/Akira (1988)/Akira.mkv"),
              std::filesystem::path("/mnt/movies/Akira (1988)"));
}

TEST(PathMapperTest, SeasonDirectoryAtRootIsKept) {
    EXPECT_EQ(PathMapper::identity_folder("/Season 1/ep01.mkv"), std::filesystem::path("/Season 1"));
}
