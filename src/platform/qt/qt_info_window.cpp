#include "mirror_for_plex/platform/qt/qt_info_window.hpp"
#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/core/snapshot_slot.hpp"
#include "mirror_for_plex/utils/format_utils.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include <QFont>
#include <QFontDatabase>
#include <QHBoxLayout>
#include <QPixmap>
#include <QScrollBar>
#include <QVBoxLayout>
#include <QWidget>
#include <utility>

namespace mirror_for_plex::platform::qt {

void LogLineQueue::push(std::string line) {
    std::lock_guard lock(m_mutex);
    m_lines.push_back(std::move(line));
    if (m_lines.size() > MAX_PENDING) {
        m_lines.pop_front();
    }
}

std::deque<std::string> LogLineQueue::take_all() {
    std::lock_guard lock(m_mutex);
    return std::exchange(m_lines, {});
}

QtInfoWindow::QtInfoWindow(core::Application& app, std::shared_ptr<LogLineQueue> log_queue, QWidget* parent)
    : QMainWindow(parent), m_app(app), m_log_queue(std::move(log_queue)) {
    setWindowTitle("Mirror for Plex");
    setMinimumSize(800, 480);
    resize(1000, 560);
    setup_ui();

    m_refresh_timer = new QTimer(this);
    connect(m_refresh_timer, &QTimer::timeout, this, &QtInfoWindow::refresh);
    m_refresh_timer->start(200);

    refresh();
}

void QtInfoWindow::setup_ui() {
    auto* central = new QWidget(this);
    auto* main_layout = new QHBoxLayout(central);

    // Left: status, controls and log console
    auto* left_layout = new QVBoxLayout();

    m_status_label = new QLabel("Idle");
    m_status_label->setWordWrap(true);
    QFont status_font = m_status_label->font();
    status_font.setBold(true);
    m_status_label->setFont(status_font);
    left_layout->addWidget(m_status_label);

    auto* button_layout = new QHBoxLayout();
    m_start_button = new QPushButton("Start sync");
    m_stop_button = new QPushButton("Stop sync");
    connect(m_start_button, &QPushButton::clicked, this, &QtInfoWindow::on_start_clicked);
    connect(m_stop_button, &QPushButton::clicked, this, &QtInfoWindow::on_stop_clicked);
    button_layout->addWidget(m_start_button);
    button_layout->addWidget(m_stop_button);
    button_layout->addStretch();
    left_layout->addLayout(button_layout);

    m_console = new QPlainTextEdit();
    m_console->setReadOnly(true);
    m_console->setMaximumBlockCount(MAX_CONSOLE_LINES);
    m_console->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    left_layout->addWidget(m_console, 1);

    main_layout->addLayout(left_layout, 3);

    // Right: show information
    auto* right_panel = new QWidget();
    right_panel->setFixedWidth(COVER_WIDTH + 24);
    auto* right_layout = new QVBoxLayout(right_panel);

    m_cover_label = new QLabel();
    m_cover_label->setFixedWidth(COVER_WIDTH);
    m_cover_label->setAlignment(Qt::AlignCenter);
    right_layout->addWidget(m_cover_label);

    m_romaji_label = new QLabel();
    m_romaji_label->setWordWrap(true);
    QFont title_font = m_romaji_label->font();
    title_font.setBold(true);
    title_font.setPointSize(title_font.pointSize() + 2);
    m_romaji_label->setFont(title_font);
    right_layout->addWidget(m_romaji_label);

    m_english_label = new QLabel();
    m_english_label->setWordWrap(true);
    right_layout->addWidget(m_english_label);

    m_synopsis_label = new QLabel();
    m_synopsis_label->setWordWrap(true);
    m_synopsis_label->setAlignment(Qt::AlignTop | Qt::AlignLeft);
    right_layout->addWidget(m_synopsis_label, 1);

    main_layout->addWidget(right_panel);

    setCentralWidget(central);
    update_buttons();
}

void QtInfoWindow::refresh() {
    if (m_log_queue) {
        auto lines = m_log_queue->take_all();
        for (const auto& line : lines) {
            m_console->appendPlainText(QString::fromStdString(line));
        }
        if (!lines.empty()) {
            m_console->verticalScrollBar()->setValue(m_console->verticalScrollBar()->maximum());
        }
    }

    if (auto snapshot = m_app.get_snapshot_slot()->read_if_newer(m_last_seen)) {
        show_snapshot(*snapshot);
    }
    update_buttons();
}

void QtInfoWindow::show_snapshot(const core::PlaybackSnapshot& snapshot) {
    m_status_label->setText(QString::fromStdString(utils::format_snapshot(snapshot)));

    if (!snapshot.identity || !snapshot.identity->is_resolved()) {
        m_romaji_label->setText(QString::fromStdString(snapshot.display_title));
        m_english_label->clear();
        m_synopsis_label->clear();
        show_cover({});
        return;
    }

    const auto& identity = *snapshot.identity;
    m_romaji_label->setText(QString::fromStdString(
        identity.romaji_title.empty() ? snapshot.display_title : identity.romaji_title));
    m_english_label->setText(identity.english_title == identity.romaji_title
        ? QString() : QString::fromStdString(identity.english_title));
    m_synopsis_label->setText(QString::fromStdString(utils::truncate_at_word(identity.synopsis, SYNOPSIS_LIMIT)));
    show_cover(identity.image_file_name);
}

void QtInfoWindow::show_cover(const std::string& image_file_name) {
    if (image_file_name == m_shown_image && !m_cover_label->pixmap().isNull()) {
        return;
    }

    m_cover_label->clear();
    m_shown_image.clear();
    if (image_file_name.empty()) {
        return;
    }

    auto path = m_app.image_path(image_file_name);
    QPixmap pixmap(QString::fromStdString(path.string()));
    if (pixmap.isNull()) {
        // Downloaded by the sync thread; retried on the next snapshot
        MIRROR_LOG_DEBUG("QtInfoWindow", "Cover not available yet: " + path.string());
        return;
    }

    m_cover_label->setPixmap(pixmap.scaledToWidth(COVER_WIDTH, Qt::SmoothTransformation));
    m_shown_image = image_file_name;
}

void QtInfoWindow::update_buttons() {
    const bool syncing = m_app.is_syncing();
    if (m_stopping && !syncing) {
        // The sync thread has exited; joining it no longer blocks
        m_app.stop_sync();
        m_stopping = false;
    }
    m_start_button->setEnabled(!syncing && !m_stopping);
    m_stop_button->setEnabled(syncing && !m_stopping);
}

void QtInfoWindow::on_start_clicked() {
    if (!m_app.start_sync()) {
        MIRROR_LOG_ERROR("QtInfoWindow", "Could not start sync");
    }
    update_buttons();
}

void QtInfoWindow::on_stop_clicked() {
    m_stopping = true;
    m_status_label->setText("Stopping sync...");
    m_app.request_stop_sync();
    update_buttons();
}

} // namespace mirror_for_plex::platform::qt
