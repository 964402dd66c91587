#include "mirror_for_plex/services/player/control_channel.hpp"
#include "mirror_for_plex/utils/json_helper.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace mirror_for_plex {
namespace services {

using utils::JsonHelper;

MpvIpcChannel::MpvIpcChannel(std::chrono::milliseconds io_timeout)
    : m_io_timeout(io_timeout) {
}

MpvIpcChannel::~MpvIpcChannel() {
    disconnect();
}

std::expected<void, core::SyncError> MpvIpcChannel::connect(const std::string& endpoint) {
    disconnect();

    struct sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    if (endpoint.length() >= sizeof(addr.sun_path)) {
        MIRROR_LOG_ERROR("MpvIpc", "Socket path too long: " + endpoint);
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    m_socket = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_socket < 0) {
        MIRROR_LOG_ERROR("MpvIpc", "Failed to create socket: " + std::string(strerror(errno)));
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }

    if (::connect(m_socket, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        MIRROR_LOG_DEBUG("MpvIpc", "Failed to connect to socket: " + endpoint + ": " + std::string(strerror(errno)));
        close(m_socket);
        m_socket = -1;
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }

    MIRROR_LOG_DEBUG("MpvIpc", "Connected to socket: " + endpoint);
    return {};
}

void MpvIpcChannel::disconnect() {
    if (m_socket >= 0) {
        close(m_socket);
        m_socket = -1;
    }
    m_read_buffer.clear();
}

std::expected<void, core::SyncError> MpvIpcChannel::load_file(const std::string& path) {
    auto reply = command(nlohmann::json::array({"loadfile", path, "replace"}));
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return {};
}

std::expected<std::string, core::SyncError> MpvIpcChannel::current_path() {
    auto reply = command(nlohmann::json::array({"get_property", "path"}));
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return JsonHelper::get_string(reply.value(), "data");
}

std::expected<void, core::SyncError> MpvIpcChannel::quit() {
    if (!is_connected()) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    // mpv may close the socket before replying to quit
    std::string line = encode_command(nlohmann::json::array({"quit"}), m_next_request_id++);
    if (!write_data(line)) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }
    return {};
}

std::expected<nlohmann::json, core::SyncError> MpvIpcChannel::command(const nlohmann::json& args) {
    if (!is_connected()) {
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }

    const std::int64_t request_id = m_next_request_id++;
    std::string line = encode_command(args, request_id);
    MIRROR_LOG_DEBUG("MpvIpc", "Sending: " + line.substr(0, line.size() - 1));

    if (!write_data(line)) {
        disconnect();
        return std::unexpected(core::SyncError::ControlChannelUnavailable);
    }

    auto deadline = std::chrono::steady_clock::now() + m_io_timeout;
    while (true) {
        auto received = read_line(deadline);
        if (!received) {
            disconnect();
            return std::unexpected(received.error());
        }

        auto reply = parse_reply(received.value(), request_id);
        if (!reply) {
            continue;
        }

        std::string status = JsonHelper::get_string(reply.value(), "error");
        if (status != "success") {
            MIRROR_LOG_WARNING("MpvIpc", "Command " + args.dump() + " failed: " + status);
            return std::unexpected(core::SyncError::ControlChannelUnavailable);
        }
        return reply.value();
    }
}

std::string MpvIpcChannel::encode_command(const nlohmann::json& args, std::int64_t request_id) {
    nlohmann::json payload = {{"command", args}, {"request_id", request_id}};
    return payload.dump() + "\n";
}

std::optional<nlohmann::json> MpvIpcChannel::parse_reply(const std::string& line, std::int64_t request_id) {
    auto parsed = JsonHelper::safe_parse(line);
    if (!parsed || !parsed->is_object()) {
        return std::nullopt;
    }
    const auto& json = parsed.value();
    if (JsonHelper::has_field(json, "event")) {
        return std::nullopt;
    }
    if (JsonHelper::get_optional<std::int64_t>(json, "request_id", -1) != request_id) {
        return std::nullopt;
    }
    return json;
}

bool MpvIpcChannel::write_data(const std::string& data) {
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        const ssize_t sent = send(m_socket, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            MIRROR_LOG_WARNING("MpvIpc", "Failed to write data to socket: " + std::string(strerror(errno)));
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

std::expected<std::string, core::SyncError> MpvIpcChannel::read_line(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto newline = m_read_buffer.find('\n');
        if (newline != std::string::npos) {
            std::string line = m_read_buffer.substr(0, newline);
            m_read_buffer.erase(0, newline + 1);
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            MIRROR_LOG_WARNING("MpvIpc", "Timed out waiting for reply");
            return std::unexpected(core::SyncError::ControlChannelUnavailable);
        }

        struct pollfd pfd {};
        pfd.fd = m_socket;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            MIRROR_LOG_WARNING("MpvIpc", "poll failed: " + std::string(strerror(errno)));
            return std::unexpected(core::SyncError::ControlChannelUnavailable);
        }
        if (ready == 0) {
            continue;
        }

        char buffer[4096];
        const ssize_t received = recv(m_socket, buffer, sizeof(buffer), 0);
        if (received <= 0) {
            if (received < 0 && errno == EINTR) {
                continue;
            }
            MIRROR_LOG_DEBUG("MpvIpc", received < 0 ? "Error reading from socket: " + std::string(strerror(errno))
                                                    : std::string("Socket closed by player"));
            return std::unexpected(core::SyncError::ControlChannelUnavailable);
        }
        m_read_buffer.append(buffer, static_cast<size_t>(received));
    }
}

} // namespace services
} // namespace mirror_for_plex
