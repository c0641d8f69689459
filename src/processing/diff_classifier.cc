#include "diff_classifier.hpp"

#include "line_scanner.hpp"
#include "util/whitespace.hpp"

using namespace checkfiles;

namespace {

DiffClassifierState
close_current_file(DiffClassifierState state) {
    if (state.current_file) {
        state.reports.push_back(std::move(state.accumulator));
    }
    state.current_file.reset();
    state.accumulator = FileReport{};
    state.hunk_context.clear();
    state.last_inserted.clear();
    return state;
}

void
record(DiffClassifierState& state, const DiffToken& token, ViolationKind kind, std::optional<LinePointer> pointer) {
    Violation violation;
    violation.file = *state.current_file;
    violation.line = token.line_number;
    violation.kind = kind;
    violation.pointer = std::move(pointer);
    violation.hunk = state.hunk_context;
    state.accumulator.add(std::move(violation));
}

}  // namespace

bool
checkfiles::is_checkable_change(const ChangeInfo& change) {
    return change.parent_count == 1;
}

std::optional<std::string>
checkfiles::diff_header_path(std::string_view header) {
    if (header.substr(0, 3) != "+++") {
        return std::nullopt;
    }
    header.remove_prefix(3);
    while (!header.empty() && header.front() == ' ') {
        header.remove_prefix(1);
    }

    auto tab = header.find('\t');
    if (tab != std::string_view::npos) {
        header = header.substr(0, tab);
    }
    header = right_trim(header);

    if (header.empty() || header == "/dev/null") {
        return std::nullopt;
    }
    if (header.substr(0, 2) == "b/") {
        header.remove_prefix(2);
    }
    if (header.empty()) {
        return std::nullopt;
    }
    return std::string(header);
}

DiffClassifierState
checkfiles::diff_classify_step(DiffClassifierState state,
                               const DiffToken& token,
                               const Policy& policy,
                               const RelevanceTest& relevance) {
    switch (token.label) {
        case DiffLabel::kFileHeader: {
            state = close_current_file(std::move(state));
            auto path = diff_header_path(token.text);
            if (path) {
                auto result = relevance(*path);
                if (result == Relevance::kRelevant) {
                    state.current_file = *path;
                    state.accumulator.path = *path;
                } else if (result == Relevance::kUnreadable) {
                    state.errors.push_back(*path);
                }
            }
        } break;
        case DiffLabel::kHunkHeader: {
            state.hunk_context = token.text;
        } break;
        case DiffLabel::kInsertedLine: {
            if (state.current_file) {
                std::string_view text = token.text;
                if (!text.empty() && text.front() == '+') {
                    text.remove_prefix(1);
                }
                state.last_inserted = std::string(text);
                if (auto found = detect_indentation(text, policy)) {
                    record(state, token, found->kind, std::move(found->pointer));
                }
            }
        } break;
        case DiffLabel::kTrailingWhitespaceMarker: {
            if (state.current_file && state.last_label == DiffLabel::kInsertedLine) {
                auto pointer = trailing_whitespace_pointer(state.last_inserted + token.text, policy.tab_width);
                record(state, token, ViolationKind::kTrailingWhitespace, std::move(pointer));
            }
        } break;
        case DiffLabel::kOther:
            break;
    }

    state.last_label = token.label;
    return state;
}

DiffClassifierState
checkfiles::diff_classify_finish(DiffClassifierState state) {
    return close_current_file(std::move(state));
}

DiffClassifierState
checkfiles::diff_classify(gsl::span<const DiffToken> tokens, const Policy& policy, const RelevanceTest& relevance) {
    DiffClassifierState state;
    for (const auto& token : tokens) {
        state = diff_classify_step(std::move(state), token, policy, relevance);
    }
    return diff_classify_finish(std::move(state));
}
