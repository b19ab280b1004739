#include "../../include/text_formatter.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace qreport::text {

namespace {

bool is_continuation(const char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// End of the first code point of @p text.
size_t first_code_point(const std::string_view text) {
    size_t end = text.empty() ? 0 : 1;
    while (end < text.size() && is_continuation(text[end])) ++end;
    return end;
}

} // namespace

size_t utf8_prefix(const std::string_view text, const size_t max_bytes) {
    if (max_bytes >= text.size()) return text.size();
    size_t cut = max_bytes;
    while (cut > 0 && is_continuation(text[cut])) --cut;
    return cut;
}

std::string format_time(const TimePoint tp, const char* pattern) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, pattern);
    return os.str();
}

std::string format_iso8601_utc(const TimePoint tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string format_decimal(const double value, const int decimals) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(decimals) << value;
    return os.str();
}

std::string center(const std::string_view text, const size_t width) {
    if (text.size() >= width) {
        return std::string(text);
    }
    return std::string((width - text.size()) / 2, ' ') + std::string(text);
}

std::vector<std::string> wrap(const std::string_view text, const size_t width,
                              const std::string_view first_prefix, const std::string_view next_prefix) {
    std::vector<std::string> lines;
    std::string current(first_prefix);
    size_t prefix_len = first_prefix.size();
    bool has_word = false;

    auto flush = [&] {
        lines.push_back(current);
        current = std::string(next_prefix);
        prefix_len = next_prefix.size();
        has_word = false;
    };

    std::istringstream words{std::string(single_line(text))};
    std::string word;
    while (words >> word) {
        const size_t room = width > prefix_len ? width - prefix_len : 1;
        while (word.size() > room) {
            if (has_word) flush();
            size_t r = utf8_prefix(word, width > prefix_len ? width - prefix_len : 1);
            if (r == 0) r = first_code_point(word);
            current += word.substr(0, r);
            word.erase(0, r);
            has_word = true;
            flush();
        }
        if (word.empty()) continue;
        const size_t needed = word.size() + (has_word ? 1 : 0);
        if (current.size() + needed > width) {
            flush();
        }
        if (has_word) current += ' ';
        current += word;
        has_word = true;
    }
    if (has_word || lines.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string single_line(const std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        out += std::iscntrl(static_cast<unsigned char>(c)) ? ' ' : c;
    }
    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) return {};
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

std::string ellipsize(const std::string_view text, const size_t max_chars) {
    if (text.size() <= max_chars) return std::string(text);
    if (max_chars <= 3) return std::string(text.substr(0, utf8_prefix(text, max_chars)));
    return std::string(text.substr(0, utf8_prefix(text, max_chars - 3))) + "...";
}

bool is_blank(const std::string_view text) {
    return std::ranges::all_of(text, [](const unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace qreport::text
