#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mirror_for_plex {
namespace services {

// Command connection to a running player
class ControlChannel {
public:
    virtual ~ControlChannel() = default;

    virtual std::expected<void, core::SyncError> connect(const std::string& endpoint) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Replace whatever is playing with the given file
    virtual std::expected<void, core::SyncError> load_file(const std::string& path) = 0;

    // Path of the file the player has open
    virtual std::expected<std::string, core::SyncError> current_path() = 0;

    virtual std::expected<void, core::SyncError> quit() = 0;
};

// mpv JSON IPC: one JSON object per line, replies carry the request_id
class MpvIpcChannel : public ControlChannel {
public:
    explicit MpvIpcChannel(std::chrono::milliseconds io_timeout);
    ~MpvIpcChannel() override;

    MpvIpcChannel(const MpvIpcChannel&) = delete;
    MpvIpcChannel& operator=(const MpvIpcChannel&) = delete;

    std::expected<void, core::SyncError> connect(const std::string& endpoint) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override { return m_socket >= 0; }

    std::expected<void, core::SyncError> load_file(const std::string& path) override;
    std::expected<std::string, core::SyncError> current_path() override;
    std::expected<void, core::SyncError> quit() override;

    // Sends a command and waits for its reply; replies with an error status fail
    std::expected<nlohmann::json, core::SyncError> command(const nlohmann::json& args);

    static std::string encode_command(const nlohmann::json& args, std::int64_t request_id);

    // The reply to request_id, or nothing when the line is an event or another reply
    static std::optional<nlohmann::json> parse_reply(const std::string& line, std::int64_t request_id);

private:
    bool write_data(const std::string& data);
    std::expected<std::string, core::SyncError> read_line(std::chrono::steady_clock::time_point deadline);

    std::chrono::milliseconds m_io_timeout;
    int m_socket = -1;
    std::string m_read_buffer;
    std::int64_t m_next_request_id = 1;
};

} // namespace services
} // namespace mirror_for_plex
