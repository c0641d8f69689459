#pragma once

/*
    Labels the text of a unified diff with the role of each piece.

        +++ b/src/main.c          FileHeader
        @@ -10,3 +10,4 @@         HunkHeader
        +int x = 1;               InsertedLine
        +int y = 2;<space><tab>   InsertedLine, TrailingWhitespaceMarker
                                  Other (every line break)

    Inserted line tokens keep their leading '+'. Trailing spaces and tabs of
    an inserted line are split off into a marker token. Hunk line counts are
    followed so that an inserted line reading "+++ x" is not mistaken for a
    file header, and inserted lines are numbered from the new-side start of
    their hunk. Lines of a hunk whose header can't be parsed are unnumbered.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkfiles {

enum class DiffLabel {
    kFileHeader,
    kHunkHeader,
    kInsertedLine,
    kTrailingWhitespaceMarker,
    kOther,
};

struct DiffToken {
    DiffLabel label = DiffLabel::kOther;
    std::string text;
    std::optional<int64_t> line_number;
};

struct HunkRange {
    int64_t old_start = 0;
    int64_t old_count = 1;
    int64_t new_start = 0;
    int64_t new_count = 1;
};

// "@@ -10,3 +10,4 @@ func()"
bool
parse_hunk_header(std::string_view line, HunkRange& range);

std::vector<DiffToken>
label_unified_diff(std::string_view diff);

}  // namespace checkfiles
