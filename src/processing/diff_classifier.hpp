#pragma once

/*
    Restricts checking to the lines a change inserts.

    The classifier is a fold over labeled diff tokens. Each step takes the
    state by value and returns the next one:

        state = diff_classify_step(std::move(state), token, policy, relevance);

    A file header closes the report of the previous file and starts a new
    one if the new path is relevant. Inserted lines get the indentation
    check; a trailing whitespace marker counts only when it directly follows
    an inserted line of a relevant file.
*/

#include "candidate.hpp"
#include "diff_labeler.hpp"
#include "policy.hpp"
#include "violation.hpp"

#include <gsl/span>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkfiles {

using RelevanceTest = std::function<Relevance(const std::string&)>;

struct DiffClassifierState {
    std::optional<std::string> current_file;
    std::string hunk_context;
    DiffLabel last_label = DiffLabel::kOther;

    // Text of the most recent inserted line, without the leading '+'.
    std::string last_inserted;

    FileReport accumulator;
    std::vector<FileReport> reports;

    // Files whose content could not be read.
    std::vector<std::string> errors;
};

struct ChangeInfo {
    std::string revision;
    int parent_count = 1;
};

// Merges and root changes are not classified.
bool
is_checkable_change(const ChangeInfo& change);

// New-side path of a "+++ b/path<tab>metadata" header, if it names a file.
std::optional<std::string>
diff_header_path(std::string_view header);

DiffClassifierState
diff_classify_step(DiffClassifierState state,
                   const DiffToken& token,
                   const Policy& policy,
                   const RelevanceTest& relevance);

// Closes out the last file.
DiffClassifierState
diff_classify_finish(DiffClassifierState state);

DiffClassifierState
diff_classify(gsl::span<const DiffToken> tokens, const Policy& policy, const RelevanceTest& relevance);

}  // namespace checkfiles
