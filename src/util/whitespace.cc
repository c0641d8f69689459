#include "whitespace.hpp"

using namespace checkfiles;

bool
checkfiles::is_blank(char c) {
    return c == ' ' || c == '\t';
}

bool
checkfiles::is_all_blank(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!is_blank(c)) {
            return false;
        }
    }
    return true;
}

bool
checkfiles::ends_with_blank(std::string_view s) {
    return !s.empty() && is_blank(s.back());
}

std::string_view
checkfiles::right_trim(std::string_view s) {
    auto end = s.size();
    while (end > 0 && is_blank(s[end - 1])) {
        end--;
    }
    return s.substr(0, end);
}

std::size_t
checkfiles::leading_blank_length(std::string_view s) {
    std::size_t length = 0;
    while (length < s.size() && is_blank(s[length])) {
        length++;
    }
    return length;
}

std::string
checkfiles::expand_tabs(std::string_view s, int64_t tab_width) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '\t') {
            if (tab_width > 0) {
                auto column = static_cast<int64_t>(result.size());
                result.append(static_cast<std::size_t>(tab_width - (column % tab_width)), ' ');
            }
        } else {
            result.push_back(c);
        }
    }
    return result;
}

std::string
checkfiles::expand_tabs_fixed(std::string_view s, int64_t tab_width) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '\t') {
            result.append(static_cast<std::size_t>(tab_width), ' ');
        } else {
            result.push_back(c);
        }
    }
    return result;
}

bool
checkfiles::contains_nul(std::string_view s) {
    return s.find('\0') != std::string_view::npos;
}

bool
checkfiles::ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string>
checkfiles::split_list(std::string_view s) {
    auto is_separator = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ','; };

    std::vector<std::string> items;
    std::size_t cursor = 0;
    while (cursor < s.size()) {
        while (cursor < s.size() && is_separator(s[cursor])) {
            cursor++;
        }
        auto start = cursor;
        while (cursor < s.size() && !is_separator(s[cursor])) {
            cursor++;
        }
        if (cursor > start) {
            items.emplace_back(s.substr(start, cursor - start));
        }
    }
    return items;
}
