#include "fixer.hpp"

#include "util/readlines.hpp"
#include "util/whitespace.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

using namespace checkfiles;

namespace {

void
discard_temp(const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
}

}  // namespace

std::string
checkfiles::to_string(FixStatus status) {
    switch (status) {
        case FixStatus::kOk:
            return "fixed";
        case FixStatus::kUnchanged:
            return "unchanged";
        case FixStatus::kWriteFailed:
            return "write failed";
        default:
            return "unknown";
    }
}

std::string
checkfiles::fix_line(std::string_view line, const Policy& policy) {
    if (policy.indent_mode == IndentMode::kSpacesOnly) {
        return expand_tabs(right_trim(line), policy.tab_width);
    }

    if (is_all_blank(line)) {
        return {};
    }

    auto lead = leading_blank_length(line);
    auto rest = right_trim(line.substr(lead));
    if (lead == 0) {
        return std::string(rest);
    }

    auto width = static_cast<int64_t>(expand_tabs(line.substr(0, lead), policy.tab_width).size());
    std::string fixed(static_cast<std::size_t>(width / policy.tab_width), '\t');
    fixed.append(static_cast<std::size_t>(width % policy.tab_width), ' ');
    fixed += rest;
    return fixed;
}

std::string
checkfiles::fix_content(std::string_view content, const Policy& policy) {
    std::string fixed;
    fixed.reserve(content.size());

    LineReader reader(content);
    Line line;
    while (reader.next(line)) {
        fixed += fix_line(line.text, policy);
        fixed += line.eol;
    }
    return fixed;
}

FixResult
checkfiles::fix_file(const std::filesystem::path& path, std::string_view content, const Policy& policy) {
    FixResult result;

    std::string fixed = fix_content(content, policy);
    if (fixed == content) {
        result.status = FixStatus::kUnchanged;
        return result;
    }

    // Written next to the target and renamed over it, so a failed write
    // leaves the original file in place.
    std::filesystem::path temp = path;
    temp += ".checkfiles-tmp";

    FILE* f = fopen(temp.string().c_str(), "wb");
    if (!f) {
        int error = errno;
        result.status = FixStatus::kWriteFailed;
        result.error = fmt::format("Failed to open '{}' for writing: errno ({}) = {}", temp.string(), error,
                                   strerror(error));
        return result;
    }

    auto written = fwrite(fixed.data(), 1, fixed.size(), f);
    if (written != fixed.size()) {
        int error = errno;
        fclose(f);
        discard_temp(temp);
        result.status = FixStatus::kWriteFailed;
        result.error = fmt::format("Failed to write '{}': errno ({}) = {}", temp.string(), error, strerror(error));
        return result;
    }

    if (fclose(f) != 0) {
        int error = errno;
        discard_temp(temp);
        result.status = FixStatus::kWriteFailed;
        result.error = fmt::format("Failed to close '{}': errno ({}) = {}", temp.string(), error, strerror(error));
        return result;
    }

    std::error_code ec;
    auto perms = std::filesystem::status(path, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(temp, perms, ec);
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        discard_temp(temp);
        result.status = FixStatus::kWriteFailed;
        result.error = fmt::format("Failed to replace '{}': {}", path.string(), ec.message());
        return result;
    }

    return result;
}
