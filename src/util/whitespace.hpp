#pragma once

/*
    Helpers for the space/tab runs of a single line of text.

    A "blank" in this file is a space or a tab. Line terminators are not
    blanks; lines are inspected with their terminators already stripped.
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace checkfiles {

bool
is_blank(char c);

// True for non-empty strings made up of spaces and tabs only.
bool
is_all_blank(std::string_view s);

bool
ends_with_blank(std::string_view s);

std::string_view
right_trim(std::string_view s);

// Length of the longest prefix consisting of spaces and tabs.
std::size_t
leading_blank_length(std::string_view s);

// Column aware tab expansion; a tab advances to the next multiple of `tab_width`.
std::string
expand_tabs(std::string_view s, int64_t tab_width);

// Every tab becomes exactly `tab_width` spaces, regardless of column.
std::string
expand_tabs_fixed(std::string_view s, int64_t tab_width);

bool
contains_nul(std::string_view s);

bool
ends_with(std::string_view s, std::string_view suffix);

// Split a "list" setting on spaces, tabs, newlines and commas; i.e ".c .h, .cpp"
std::vector<std::string>
split_list(std::string_view s);

}  // namespace checkfiles
