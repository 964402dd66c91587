#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <QLabel>
#include <QMainWindow>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTimer>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace mirror_for_plex::core {
class Application;
}

namespace mirror_for_plex::platform::qt {

// Log lines handed from any thread to the GUI thread
class LogLineQueue {
public:
    void push(std::string line);
    std::deque<std::string> take_all();

    // Oldest lines are dropped beyond this while nobody drains the queue
    static constexpr std::size_t MAX_PENDING = 5000;

private:
    std::mutex m_mutex;
    std::deque<std::string> m_lines;
};

/**
 * Info panel for the mirror.
 *
 * Left side: status line, Start/Stop sync and the log console. Right side:
 * cover image, romaji and English titles and the synopsis of the show the
 * remote user is watching. A timer polls the snapshot slot and the log
 * queue; nothing from the sync thread touches widgets directly.
 */
class QtInfoWindow : public QMainWindow {
    Q_OBJECT

public:
    QtInfoWindow(core::Application& app, std::shared_ptr<LogLineQueue> log_queue, QWidget* parent = nullptr);
    ~QtInfoWindow() override = default;

    static constexpr int COVER_WIDTH = 300;
    static constexpr std::size_t SYNOPSIS_LIMIT = 600;
    static constexpr int MAX_CONSOLE_LINES = 2000;

private:
    void setup_ui();
    void refresh();
    void show_snapshot(const core::PlaybackSnapshot& snapshot);
    void show_cover(const std::string& image_file_name);
    void update_buttons();

    void on_start_clicked();
    void on_stop_clicked();

    core::Application& m_app;
    std::shared_ptr<LogLineQueue> m_log_queue;
    std::uint64_t m_last_seen = 0;
    std::string m_shown_image;
    bool m_stopping = false;

    QLabel* m_status_label = nullptr;
    QPushButton* m_start_button = nullptr;
    QPushButton* m_stop_button = nullptr;
    QPlainTextEdit* m_console = nullptr;

    QLabel* m_cover_label = nullptr;
    QLabel* m_romaji_label = nullptr;
    QLabel* m_english_label = nullptr;
    QLabel* m_synopsis_label = nullptr;

    QTimer* m_refresh_timer = nullptr;
};

} // namespace mirror_for_plex::platform::qt
