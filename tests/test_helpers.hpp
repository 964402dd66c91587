#pragma once

#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "mirror_for_plex/services/catalog/catalog_client.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/services/player/control_channel.hpp"
#include "mirror_for_plex/services/player/player_process.hpp"
#include "mirror_for_plex/services/plex/session_source.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace mirror_for_plex::test {

// Per-test scratch directory, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

    // Creates the file (and its parents) with the given content
    std::filesystem::path write_file(const std::string& relative, const std::string& content) const;

private:
    std::filesystem::path m_path;
};

std::string read_file(const std::filesystem::path& path);

class MockHttpClient : public services::HttpClient {
public:
    MOCK_METHOD((std::expected<services::HttpResponse, services::NetworkError>), execute,
                (const services::HttpRequest&), (override));
    MOCK_METHOD((std::expected<services::HttpResponse, services::NetworkError>), get,
                (const std::string&, const services::HttpHeaders&, std::chrono::seconds), (override));
    MOCK_METHOD((std::expected<services::HttpResponse, services::NetworkError>), post_json,
                (const std::string&, const std::string&, const services::HttpHeaders&, std::chrono::seconds),
                (override));
    MOCK_METHOD((std::expected<void, services::NetworkError>), download_file,
                (const std::string&, const std::filesystem::path&, std::chrono::seconds), (override));
    MOCK_METHOD(void, set_default_timeout, (std::chrono::seconds), (override));
    MOCK_METHOD(void, set_cancel_token, (std::stop_token), (override));
};

services::HttpResponse make_response(services::HttpStatus status, std::string body);

class MockCatalogClient : public services::CatalogClient {
public:
    explicit MockCatalogClient(std::string name) : m_name(std::move(name)) {}

    std::string name() const override { return m_name; }

    MOCK_METHOD((std::expected<std::vector<services::CatalogEntry>, core::SyncError>), search_titles,
                (const std::string&), (override));

private:
    std::string m_name;
};

services::CatalogEntry make_entry(std::string id, std::vector<std::string> titles, std::string image_url = {});

class MockSessionSource : public services::RemoteSessionSource {
public:
    MOCK_METHOD((std::expected<std::optional<core::RemoteSession>, core::SyncError>), get_active_session,
                (const std::string&, const std::vector<std::string>&), (override));
};

class MockImageStore : public services::ImageStore {
public:
    MOCK_METHOD((std::expected<std::filesystem::path, core::SyncError>), ensure_image,
                (const core::FolderIdentity&), (override));
    MOCK_METHOD(std::filesystem::path, path_for, (const std::string&), (const, override));
};

// Shared state so a test can inspect the fakes after handing them to a controller
struct FakePlayerState {
    int spawn_count = 0;
    bool running = false;
    bool fail_spawn = false;
    bool exit_on_quit = true;
    bool exit_on_terminate = true;
    int terminate_count = 0;
    int kill_count = 0;
    std::vector<std::string> last_args;

    int connect_failures_left = 0;   // connect attempts that fail before one succeeds
    int connect_count = 0;
    bool connected = false;
    bool fail_load = false;
    bool fail_status = false;
    std::vector<std::string> loaded_files;
    std::string current_path;
    int quit_count = 0;
};

class FakePlayerProcess : public services::PlayerProcess {
public:
    explicit FakePlayerProcess(std::shared_ptr<FakePlayerState> state) : m_state(std::move(state)) {}

    std::expected<void, core::SyncError> spawn(const std::string& executable,
                                               const std::vector<std::string>& args) override;
    bool is_running() override { return m_state->running; }
    bool wait_for_exit(std::chrono::milliseconds) override { return !m_state->running; }
    void terminate() override;
    void kill() override;
    pid_t pid() const override { return m_state->running ? 4242 : -1; }

private:
    std::shared_ptr<FakePlayerState> m_state;
};

class FakeControlChannel : public services::ControlChannel {
public:
    explicit FakeControlChannel(std::shared_ptr<FakePlayerState> state) : m_state(std::move(state)) {}

    std::expected<void, core::SyncError> connect(const std::string& endpoint) override;
    void disconnect() override { m_state->connected = false; }
    bool is_connected() const override { return m_state->connected; }
    std::expected<void, core::SyncError> load_file(const std::string& path) override;
    std::expected<std::string, core::SyncError> current_path() override;
    std::expected<void, core::SyncError> quit() override;

private:
    std::shared_ptr<FakePlayerState> m_state;
};

} // namespace mirror_for_plex::test
