#include "mirror_for_plex/core/application.hpp"
#include "test_helpers.hpp"

#include <cstdlib>

using namespace mirror_for_plex;
using core::ConfigManager;
using test::TempDir;

namespace {

// Sets an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : m_name(name) {
        if (const char* previous = std::getenv(name)) {
            m_previous = previous;
        }
        ::setenv(name, value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (m_previous) {
            ::setenv(m_name, m_previous->c_str(), 1);
        } else {
            ::unsetenv(m_name);
        }
    }

private:
    const char* m_name;
    std::optional<std::string> m_previous;
};

} // namespace

TEST(ConfigManagerTest, FirstRunWritesDocumentedDefaults) {
    TempDir dir;
    ConfigManager manager(dir / "mirror" / "config.yaml");

    auto loaded = manager.load();

    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error(), core::ConfigError::FileNotFound);
    ASSERT_TRUE(std::filesystem::exists(dir / "mirror" / "config.yaml"));
    auto content = test::read_file(dir / "mirror" / "config.yaml");
    EXPECT_TRUE(content.starts_with("# Mirror for Plex configuration"));
    EXPECT_NE(content.find("plex.username"), std::string::npos);

    // The written defaults load, but still need the user's details
    ConfigManager second(dir / "mirror" / "config.yaml");
    ASSERT_TRUE(second.load());
    EXPECT_FALSE(second.get().validate());
}

TEST(ConfigManagerTest, LoadsExistingFile) {
    TempDir dir;
    auto path = dir.write_file("config.yaml",
                               "plex:\n  token: t\n  username: alice\n  libraries: [Anime]\n");

    ConfigManager manager(path);
    ASSERT_TRUE(manager.load());

    EXPECT_EQ(manager.get().plex.username, "alice");
    EXPECT_TRUE(manager.get().validate());
    EXPECT_EQ(manager.config_path(), path);
    EXPECT_EQ(manager.data_directory(), dir.path());
}

TEST(ConfigManagerTest, MalformedFileIsReported) {
    TempDir dir;
    auto path = dir.write_file("config.yaml", "plex: [\n");

    ConfigManager manager(path);
    auto loaded = manager.load();

    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error(), core::ConfigError::InvalidFormat);
}

TEST(ConfigManagerTest, EnvironmentOverridesDefaultPath) {
    TempDir dir;
    ScopedEnv env("MIRROR_FOR_PLEX_CONFIG", (dir / "custom.yaml").string());

    EXPECT_EQ(ConfigManager::default_config_path(), dir / "custom.yaml");
    ConfigManager manager;
    EXPECT_EQ(manager.config_path(), dir / "custom.yaml");
}

TEST(ConfigManagerTest, DefaultPathFollowsXdgConfigHome) {
    TempDir dir;
    ScopedEnv no_override("MIRROR_FOR_PLEX_CONFIG", "");
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().string());

    EXPECT_EQ(ConfigManager::default_config_path(), dir / "mirror-for-plex" / "config.yaml");
}
