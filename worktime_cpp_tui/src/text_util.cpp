#include "text_util.hpp"

#include <algorithm>
#include <cstring>
#include <cwchar>
#include <sstream>

namespace worktime {

int display_width_utf8(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    std::mbstate_t state{};
    const char* ptr = text.data();
    size_t len = text.size();
    int width = 0;

    while (len > 0) {
        wchar_t wc = 0;
        const size_t consumed = std::mbrtowc(&wc, ptr, len, &state);
        if (consumed == static_cast<size_t>(-1) || consumed == static_cast<size_t>(-2)) {
            // Treat invalid bytes as width 1 to keep columns stable.
            std::memset(&state, 0, sizeof(state));
            ++width;
            ++ptr;
            --len;
            continue;
        }
        if (consumed == 0) {
            break;
        }
        int wcw = wcwidth(wc);
        if (wcw < 0) {
            wcw = 1;
        }
        width += wcw;
        ptr += consumed;
        len -= consumed;
    }
    return width;
}

std::string truncate_utf8_by_width(const std::string& text, int max_width) {
    if (max_width <= 0 || text.empty()) {
        return "";
    }

    std::mbstate_t state{};
    const char* ptr = text.data();
    size_t len = text.size();
    int width = 0;
    std::string out;

    while (len > 0) {
        wchar_t wc = 0;
        const size_t consumed = std::mbrtowc(&wc, ptr, len, &state);
        if (consumed == static_cast<size_t>(-1) || consumed == static_cast<size_t>(-2)) {
            std::memset(&state, 0, sizeof(state));
            if (width + 1 > max_width) {
                break;
            }
            out.push_back(*ptr);
            ++ptr;
            --len;
            ++width;
            continue;
        }
        if (consumed == 0) {
            break;
        }
        int wcw = wcwidth(wc);
        if (wcw < 0) {
            wcw = 1;
        }
        if (width + wcw > max_width) {
            break;
        }
        out.append(ptr, consumed);
        ptr += consumed;
        len -= consumed;
        width += wcw;
    }

    return out;
}

std::string pad_right_display(const std::string& text, int width) {
    const std::string clipped = truncate_utf8_by_width(text, width);
    const int used = display_width_utf8(clipped);
    return clipped + std::string(std::max(0, width - used), ' ');
}

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string collapse_spaces(const std::string& s) {
    std::istringstream words(s);
    std::string word;
    std::string out;
    while (words >> word) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += word;
    }
    return out;
}

std::vector<std::string> wrap_words(const std::string& text, int width) {
    std::vector<std::string> lines;
    if (width <= 0) {
        return lines;
    }

    std::istringstream words(text);
    std::string word;
    std::string current;
    int current_w = 0;
    while (words >> word) {
        int word_w = display_width_utf8(word);
        if (current_w > 0 && current_w + 1 + word_w <= width) {
            current += " " + word;
            current_w += 1 + word_w;
            continue;
        }
        if (current_w > 0) {
            lines.push_back(current);
            current.clear();
            current_w = 0;
        }
        while (word_w > width) {
            std::string head = truncate_utf8_by_width(word, width);
            if (head.empty()) {
                // A single glyph wider than the line.
                head = word.substr(0, 1);
            }
            lines.push_back(head);
            word.erase(0, head.size());
            word_w = display_width_utf8(word);
        }
        current = word;
        current_w = word_w;
    }
    if (current_w > 0 || lines.empty()) {
        lines.push_back(current);
    }
    return lines;
}

void pop_utf8_char(std::string& s) {
    while (!s.empty()) {
        const auto byte = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((byte & 0xC0) != 0x80) {
            break;
        }
    }
}

} // namespace worktime
