#include "mirror_for_plex/utils/format_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace mirror_for_plex::utils {

namespace {

void append_utf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x110000) {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

// Decodes the entity starting at text[pos] == '&'; returns the consumed length, or 0
std::size_t decode_entity(std::string_view text, std::size_t pos, std::string& out) {
    auto end = text.find(';', pos);
    if (end == std::string_view::npos || end - pos > 10) {
        return 0;
    }
    std::string_view name = text.substr(pos + 1, end - pos - 1);

    static constexpr std::array<std::pair<std::string_view, std::string_view>, 9> named = {{
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", " "}, {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"}, {"hellip", "\xE2\x80\xA6"}
    }};
    for (const auto& [key, value] : named) {
        if (name == key) {
            out += value;
            return end - pos + 1;
        }
    }

    if (name.size() > 1 && name[0] == '#') {
        unsigned long code_point = 0;
        bool hex = name[1] == 'x' || name[1] == 'X';
        std::string_view digits = name.substr(hex ? 2 : 1);
        if (digits.empty()) {
            return 0;
        }
        for (char c : digits) {
            auto uc = static_cast<unsigned char>(c);
            if (hex && std::isxdigit(uc)) {
                code_point = code_point * 16 + static_cast<unsigned long>(
                    std::isdigit(uc) ? c - '0' : std::tolower(uc) - 'a' + 10);
            } else if (!hex && std::isdigit(uc)) {
                code_point = code_point * 10 + static_cast<unsigned long>(c - '0');
            } else {
                return 0;
            }
            if (code_point > 0x10FFFF) {
                return 0;
            }
        }
        append_utf8(out, code_point);
        return end - pos + 1;
    }

    return 0;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::string strip_html(const std::string& html) {
    std::string text;
    text.reserve(html.size());

    std::size_t i = 0;
    while (i < html.size()) {
        char c = html[i];
        if (c == '<') {
            auto close = html.find('>', i);
            if (close == std::string::npos) {
                break;
            }
            std::string tag = html.substr(i + 1, close - i - 1);
            std::transform(tag.begin(), tag.end(), tag.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            if (tag.starts_with("br") || tag == "/p") {
                text += '\n';
            }
            i = close + 1;
        } else if (c == '&') {
            std::size_t consumed = decode_entity(html, i, text);
            if (consumed == 0) {
                text += c;
                ++i;
            } else {
                i += consumed;
            }
        } else {
            text += c;
            ++i;
        }
    }

    // At most one blank line in a row
    std::string collapsed;
    collapsed.reserve(text.size());
    int newlines = 0;
    for (char c : text) {
        if (c == '\r') {
            continue;
        }
        newlines = (c == '\n') ? newlines + 1 : 0;
        if (newlines <= 2) {
            collapsed += c;
        }
    }

    return trim(collapsed);
}

std::string truncate_at_word(const std::string& text, std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }

    std::size_t cut = max_chars;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    auto space = text.find_last_of(" \t\n", cut);
    if (space != std::string::npos && space > max_chars / 2) {
        cut = space;
    }

    std::string result = text.substr(0, cut);
    auto last = result.find_last_not_of(" \t\n.,;:");
    result.erase(last == std::string::npos ? 0 : last + 1);
    return result + "...";
}

std::string format_snapshot(const core::PlaybackSnapshot& snapshot) {
    std::string line = core::to_string(snapshot.state);

    if (!snapshot.display_title.empty()) {
        line += ": " + snapshot.display_title;
        if (!snapshot.library_name.empty()) {
            line += " [" + snapshot.library_name + "]";
        }
        if (snapshot.state == core::SyncState::Playing && !snapshot.is_playing) {
            line += " (paused)";
        }
    }

    if (!snapshot.message.empty()) {
        line += " - " + snapshot.message;
    }
    return line;
}

} // namespace mirror_for_plex::utils
