#include "mirror_for_plex/utils/yaml_config.hpp"
#include "test_helpers.hpp"

using namespace mirror_for_plex;
using test::TempDir;
using utils::YamlConfigHelper;

TEST(YamlConfigTest, LoadsEverySection) {
    TempDir dir;
    auto path = dir.write_file("config.yaml", R"(
log_level: debug
plex:
  server_url: http://nas.local:32400
  token: abc123
  username: alice
  libraries: [Anime, Anime Movies]
  poll_interval: 5
  timeout: 8
path_mappings:
  - remote: /data/anime
    local: /mnt/anime
  - local: /missing/remote
catalogs:
  timeout: 4
  match_threshold: 0.75
  anilist:
    enabled: false
  tvdb:
    enabled: true
    api_key: tvdb-key
player:
  executable: /usr/bin/mpv
  ipc_endpoint: /tmp/test.sock
  geometry: 640x360
  extra_args: ["--osc=no"]
  launch_attempts: 3
  retry_delay_ms: 50
  max_retry_delay_ms: 400
  ipc_timeout_ms: 700
  quit_grace_ms: 900
storage:
  identity_cache: /var/lib/mirror/matches.json
  thumbs_dir: /var/lib/mirror/thumbs
)");

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded);
    const auto& config = *loaded;

    EXPECT_EQ(config.log_level, utils::LogLevel::Debug);
    EXPECT_EQ(config.plex.server_url, "http://nas.local:32400");
    EXPECT_EQ(config.plex.token, "abc123");
    EXPECT_EQ(config.plex.username, "alice");
    EXPECT_EQ(config.plex.libraries, (std::vector<std::string>{"Anime", "Anime Movies"}));
    EXPECT_EQ(config.plex.poll_interval, std::chrono::seconds(5));
    EXPECT_EQ(config.plex.timeout, std::chrono::seconds(8));

    ASSERT_EQ(config.path_mappings.size(), 1u);
    EXPECT_EQ(config.path_mappings[0].remote_prefix, "/data/anime");
    EXPECT_EQ(config.path_mappings[0].local_prefix, "/mnt/anime");

    EXPECT_EQ(config.catalogs.timeout, std::chrono::seconds(4));
    EXPECT_DOUBLE_EQ(config.catalogs.match_threshold, 0.75);
    EXPECT_FALSE(config.catalogs.enable_anilist);
    EXPECT_TRUE(config.catalogs.enable_tvdb);
    EXPECT_EQ(config.catalogs.tvdb_api_key, "tvdb-key");

    EXPECT_EQ(config.player.executable, "/usr/bin/mpv");
    EXPECT_EQ(config.player.ipc_endpoint, "/tmp/test.sock");
    EXPECT_EQ(config.player.geometry, "640x360");
    EXPECT_EQ(config.player.extra_args, (std::vector<std::string>{"--osc=no"}));
    EXPECT_EQ(config.player.launch_attempts, 3);
    EXPECT_EQ(config.player.retry_delay, std::chrono::milliseconds(50));
    EXPECT_EQ(config.player.max_retry_delay, std::chrono::milliseconds(400));
    EXPECT_EQ(config.player.ipc_timeout, std::chrono::milliseconds(700));
    EXPECT_EQ(config.player.quit_grace, std::chrono::milliseconds(900));

    EXPECT_EQ(config.storage.identity_cache, std::filesystem::path("/var/lib/mirror/matches.json"));
    EXPECT_EQ(config.storage.thumbs_dir, std::filesystem::path("/var/lib/mirror/thumbs"));
}

TEST(YamlConfigTest, MissingKeysKeepDefaults) {
    TempDir dir;
    auto path = dir.write_file("config.yaml", "plex:\n  username: bob\n  libraries: Anime\n");

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded);

    core::ApplicationConfig defaults;
    EXPECT_EQ(loaded->plex.username, "bob");
    EXPECT_EQ(loaded->plex.libraries, (std::vector<std::string>{"Anime"}));
    EXPECT_EQ(loaded->plex.server_url, defaults.plex.server_url);
    EXPECT_EQ(loaded->plex.poll_interval, defaults.plex.poll_interval);
    EXPECT_DOUBLE_EQ(loaded->catalogs.match_threshold, defaults.catalogs.match_threshold);
    EXPECT_EQ(loaded->player.executable, "mpv");
    EXPECT_EQ(loaded->player.extra_args, defaults.player.extra_args);
}

TEST(YamlConfigTest, EmptyFileGivesDefaults) {
    TempDir dir;
    auto path = dir.write_file("config.yaml", "");

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded);
    EXPECT_TRUE(loaded->plex.username.empty());
}

TEST(YamlConfigTest, ReportsMissingAndMalformedFiles) {
    TempDir dir;

    auto missing = YamlConfigHelper::load_from_file(dir / "absent.yaml");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error(), core::ConfigError::FileNotFound);

    auto broken = YamlConfigHelper::load_from_file(dir.write_file("broken.yaml", "plex: [unclosed\n"));
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error(), core::ConfigError::InvalidFormat);

    auto list = YamlConfigHelper::load_from_file(dir.write_file("list.yaml", "- a\n- b\n"));
    ASSERT_FALSE(list);
    EXPECT_EQ(list.error(), core::ConfigError::InvalidFormat);

    auto wrong_type = YamlConfigHelper::load_from_file(dir.write_file("type.yaml", "plex:\n  poll_interval: soon\n"));
    ASSERT_FALSE(wrong_type);
    EXPECT_EQ(wrong_type.error(), core::ConfigError::InvalidFormat);
}

TEST(YamlConfigTest, SavedConfigLoadsBack) {
    TempDir dir;
    core::ApplicationConfig config;
    config.plex.username = "alice";
    config.plex.token = "secret";
    config.plex.libraries = {"Anime"};
    config.path_mappings = {{"/data/anime", "/mnt/anime"}};
    config.catalogs.enable_tvdb = true;
    config.catalogs.tvdb_api_key = "key";
    config.player.launch_attempts = 7;
    config.log_level = utils::LogLevel::Warning;

    auto path = dir / "nested" / "config.yaml";
    ASSERT_TRUE(YamlConfigHelper::save_to_file(config, path, "# header line\n"));
    EXPECT_TRUE(test::read_file(path).starts_with("# header line\n"));

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->plex.username, "alice");
    EXPECT_EQ(loaded->plex.token, "secret");
    EXPECT_EQ(loaded->plex.libraries, config.plex.libraries);
    ASSERT_EQ(loaded->path_mappings.size(), 1u);
    EXPECT_EQ(loaded->path_mappings[0].local_prefix, "/mnt/anime");
    EXPECT_TRUE(loaded->catalogs.enable_tvdb);
    EXPECT_EQ(loaded->player.launch_attempts, 7);
    EXPECT_EQ(loaded->log_level, utils::LogLevel::Warning);
    EXPECT_TRUE(loaded->validate());
}
