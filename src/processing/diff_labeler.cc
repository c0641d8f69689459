#include "diff_labeler.hpp"

#include "util/readlines.hpp"
#include "util/whitespace.hpp"

#include <charconv>

using namespace checkfiles;

namespace {

bool
starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Parses "<start>[,<count>]" and advances `s` past it.
bool
parse_range(std::string_view& s, int64_t& start, int64_t& count) {
    auto end = s.data() + s.size();
    auto parsed = std::from_chars(s.data(), end, start);
    if (parsed.ec != std::errc()) {
        return false;
    }
    count = 1;
    if (parsed.ptr != end && *parsed.ptr == ',') {
        parsed = std::from_chars(parsed.ptr + 1, end, count);
        if (parsed.ec != std::errc()) {
            return false;
        }
    }
    s.remove_prefix(static_cast<std::size_t>(parsed.ptr - s.data()));
    return true;
}

enum class HunkState {
    kNone,
    kCounted,
    kUncounted,
};

struct LabelerState {
    HunkState hunk = HunkState::kNone;
    int64_t old_remaining = 0;
    int64_t new_remaining = 0;
    int64_t new_line = 0;

    void
    consume(bool old_side, bool new_side) {
        if (hunk != HunkState::kCounted) {
            return;
        }
        if (old_side) {
            old_remaining--;
        }
        if (new_side) {
            new_remaining--;
            new_line++;
        }
        if (old_remaining <= 0 && new_remaining <= 0) {
            hunk = HunkState::kNone;
        }
    }

    std::optional<int64_t>
    line_number() const {
        if (hunk == HunkState::kCounted) {
            return new_line;
        }
        return std::nullopt;
    }
};

void
push_inserted_line(std::vector<DiffToken>& tokens, std::string_view text, std::optional<int64_t> line_number) {
    auto body = right_trim(text.substr(1));
    auto body_end = 1 + body.size();

    tokens.push_back({DiffLabel::kInsertedLine, std::string(text.substr(0, body_end)), line_number});
    if (body_end < text.size()) {
        tokens.push_back({DiffLabel::kTrailingWhitespaceMarker, std::string(text.substr(body_end)), line_number});
    }
}

}  // namespace

bool
checkfiles::parse_hunk_header(std::string_view line, HunkRange& range) {
    if (!starts_with(line, "@@ -")) {
        return false;
    }
    line.remove_prefix(4);

    HunkRange parsed;
    if (!parse_range(line, parsed.old_start, parsed.old_count)) {
        return false;
    }
    if (!starts_with(line, " +")) {
        return false;
    }
    line.remove_prefix(2);
    if (!parse_range(line, parsed.new_start, parsed.new_count)) {
        return false;
    }
    if (!starts_with(line, " @@")) {
        return false;
    }

    range = parsed;
    return true;
}

std::vector<DiffToken>
checkfiles::label_unified_diff(std::string_view diff) {
    std::vector<DiffToken> tokens;
    LabelerState state;

    LineReader reader(diff, LineBreaks::kNewline);
    Line line;
    while (reader.next(line)) {
        std::string_view text = line.text;

        if (state.hunk == HunkState::kUncounted && !text.empty()) {
            // Without counts a hunk lasts as long as its lines look like hunk lines.
            char c = text[0];
            if (!(c == ' ' || c == '-' || c == '\\' || (c == '+' && !starts_with(text, "+++ ")))) {
                state.hunk = HunkState::kNone;
            }
        }

        if (state.hunk != HunkState::kNone) {
            char c = text.empty() ? ' ' : text[0];
            switch (c) {
                case '+':
                    push_inserted_line(tokens, text, state.line_number());
                    state.consume(false, true);
                    break;
                case '-':
                    tokens.push_back({DiffLabel::kOther, line.text, std::nullopt});
                    state.consume(true, false);
                    break;
                case '\\':
                    tokens.push_back({DiffLabel::kOther, line.text, std::nullopt});
                    break;
                default:
                    // Context line; some tools strip the leading blank of empty ones.
                    tokens.push_back({DiffLabel::kOther, line.text, std::nullopt});
                    state.consume(true, true);
                    break;
            }
        } else if (starts_with(text, "+++ ") || text == "+++") {
            tokens.push_back({DiffLabel::kFileHeader, line.text, std::nullopt});
        } else if (starts_with(text, "@@")) {
            tokens.push_back({DiffLabel::kHunkHeader, line.text, std::nullopt});

            HunkRange range;
            if (parse_hunk_header(text, range)) {
                state.hunk = HunkState::kCounted;
                state.old_remaining = range.old_count;
                state.new_remaining = range.new_count;
                state.new_line = range.new_start;
                if (range.old_count <= 0 && range.new_count <= 0) {
                    state.hunk = HunkState::kNone;
                }
            } else {
                state.hunk = HunkState::kUncounted;
            }
        } else {
            tokens.push_back({DiffLabel::kOther, line.text, std::nullopt});
        }

        if (!line.eol.empty()) {
            tokens.push_back({DiffLabel::kOther, line.eol, std::nullopt});
        }
    }

    return tokens;
}
