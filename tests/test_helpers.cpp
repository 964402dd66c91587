#include "test_helpers.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace mirror_for_plex::test {

namespace {

// Keeps test output readable; failures are asserted, not logged
class QuietLogging : public ::testing::Environment {
public:
    void SetUp() override {
        utils::LoggerManager::set_instance(std::make_unique<utils::Logger>(utils::LogLevel::None));
    }
};

[[maybe_unused]] ::testing::Environment* const g_quiet_logging =
    ::testing::AddGlobalTestEnvironment(new QuietLogging);

} // namespace

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "mirror";
    m_path = std::filesystem::temp_directory_path() /
             ("mirror-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + "-" + name);
    std::filesystem::create_directories(m_path);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
}

std::filesystem::path TempDir::write_file(const std::string& relative, const std::string& content) const {
    auto file_path = m_path / relative;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    file << content;
    return file_path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

services::HttpResponse make_response(services::HttpStatus status, std::string body) {
    services::HttpResponse response;
    response.status_code = status;
    response.body = std::move(body);
    return response;
}

services::CatalogEntry make_entry(std::string id, std::vector<std::string> titles, std::string image_url) {
    services::CatalogEntry entry;
    entry.id = std::move(id);
    entry.titles = std::move(titles);
    if (!entry.titles.empty()) {
        entry.romaji_title = entry.titles.front();
    }
    if (entry.titles.size() > 1) {
        entry.english_title = entry.titles[1];
    }
    entry.synopsis = "Synopsis of " + entry.romaji_title;
    entry.image_url = std::move(image_url);
    return entry;
}

std::expected<void, core::SyncError> FakePlayerProcess::spawn(const std::string&,
                                                              const std::vector<std::string>& args) {
    if (m_state->fail_spawn) {
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }
    ++m_state->spawn_count;
    m_state->running = true;
    m_state->last_args = args;
    m_state->current_path = args.empty() ? std::string{} : args.back();
    return {};
}

void FakePlayerProcess::terminate() {
    ++m_state->terminate_count;
    if (m_state->exit_on_terminate) {
        m_state->running = false;
    }
}

void FakePlayerProcess::kill() {
    ++m_state->kill_count;
    m_state->running = false;
}

std::expected<void, core::SyncError> FakeControlChannel::connect(const std::string&) {
    ++m_state->connect_count;
    if (!m_state->running || m_state->connect_failures_left > 0) {
        if (m_state->connect_failures_left > 0) {
            --m_state->connect_failures_left;
        }
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    m_state->connected = true;
    return {};
}

std::expected<void, core::SyncError> FakeControlChannel::load_file(const std::string& path) {
    if (!m_state->connected || m_state->fail_load) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    m_state->loaded_files.push_back(path);
    m_state->current_path = path;
    return {};
}

std::expected<std::string, core::SyncError> FakeControlChannel::current_path() {
    if (!m_state->connected || m_state->fail_status) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    return m_state->current_path;
}

std::expected<void, core::SyncError> FakeControlChannel::quit() {
    if (!m_state->connected) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    ++m_state->quit_count;
    if (m_state->exit_on_quit) {
        m_state->running = false;
    }
    return {};
}

} // namespace mirror_for_plex::test
