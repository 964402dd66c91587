#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/core/snapshot_slot.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <thread>

using namespace mirror_for_plex;
using test::TempDir;

namespace {

// Nothing listens on port 1, so every poll fails fast and no player starts
core::ApplicationConfig unreachable_server_config(const TempDir& dir) {
    core::ApplicationConfig config;
    config.plex.server_url = "http://127.0.0.1:1";
    config.plex.token = "token";
    config.plex.username = "alice";
    config.plex.libraries = {"Anime"};
    config.plex.poll_interval = std::chrono::seconds(1);
    config.plex.timeout = std::chrono::seconds(2);
    config.catalogs.enable_anilist = false;
    config.player.ipc_endpoint = (dir / "mpv.sock").string();
    return config;
}

bool wait_until_stopped(const core::Application& app) {
    for (int i = 0; i < 500 && app.is_syncing(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return !app.is_syncing();
}

} // namespace

TEST(ApplicationTest, RequestStopReturnsBeforeSyncThreadExits) {
    TempDir dir;
    auto created = core::create_application(unreachable_server_config(dir), dir.path());
    ASSERT_TRUE(created);
    auto app = std::move(*created);
    ASSERT_TRUE(app->initialize());

    ASSERT_TRUE(app->start_sync());
    EXPECT_TRUE(app->is_syncing());

    app->request_stop_sync();
    ASSERT_TRUE(wait_until_stopped(*app));

    auto snapshot = app->get_snapshot_slot()->current();
    EXPECT_EQ(snapshot.state, core::SyncState::Idle);
    EXPECT_EQ(snapshot.message, "Sync stopped");

    // A finished thread is joined without waiting
    app->stop_sync();
    EXPECT_FALSE(app->is_syncing());
    app->shutdown();
}

TEST(ApplicationTest, SyncRestartsAfterBackgroundStop) {
    TempDir dir;
    auto created = core::create_application(unreachable_server_config(dir), dir.path());
    ASSERT_TRUE(created);
    auto app = std::move(*created);
    ASSERT_TRUE(app->initialize());

    ASSERT_TRUE(app->start_sync());
    app->request_stop_sync();
    ASSERT_TRUE(wait_until_stopped(*app));

    ASSERT_TRUE(app->start_sync());
    EXPECT_TRUE(app->is_syncing());

    app->shutdown();
    EXPECT_FALSE(app->is_syncing());
    EXPECT_EQ(app->get_state(), core::ApplicationState::Stopped);
}
