#include "candidate.hpp"

#include "util/whitespace.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

using namespace checkfiles;

namespace fs = std::filesystem;

std::string
checkfiles::to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::kOk:
            return "Success";
        case FetchStatus::kAbsent:
            return "File does not exist";
        case FetchStatus::kUnreadable:
            return "File is not readable";
        default:
            return "Unknown error";
    }
}

WorkingDirectorySource::WorkingDirectorySource(fs::path root) : root_(std::move(root)) {
}

fs::path
WorkingDirectorySource::full_path(const std::string& path) const {
    fs::path relative(path);
    if (relative.is_absolute() || root_.empty()) {
        return relative;
    }
    return root_ / relative;
}

FetchResult
WorkingDirectorySource::fetch(const std::string& path) {
    FetchResult result;
    auto file_path = full_path(path);

    std::error_code ec;
    auto status = fs::status(file_path, ec);
    if (status.type() == fs::file_type::not_found) {
        result.status = FetchStatus::kAbsent;
        result.error = to_string(FetchStatus::kAbsent);
        return result;
    }
    if (ec) {
        result.status = FetchStatus::kUnreadable;
        result.error = ec.message();
        return result;
    }

    if (!(fs::is_regular_file(status) || fs::is_fifo(status))) {
        result.status = FetchStatus::kUnreadable;
        result.error = "File is not readable (invalid file)";
        return result;
    }

    auto perms = status.permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        result.status = FetchStatus::kUnreadable;
        result.error = "File is not readable (no permission)";
        return result;
    }

    std::ifstream ifs;
    try {
        ifs.open(file_path, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            result.status = FetchStatus::kUnreadable;
            result.error = "Failed to open file for reading";
            return result;
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        if (ifs.bad()) {
            result.status = FetchStatus::kUnreadable;
            result.error = "Failed to read file";
            return result;
        }
        result.data = buffer.str();
    } catch (std::exception& e) {
        result.status = FetchStatus::kUnreadable;
        result.error = "Failed to read file: " + std::string(e.what());
        return result;
    }

    return result;
}

void
MemorySource::add(const std::string& path, std::string data) {
    files_[path] = std::move(data);
}

void
MemorySource::add_unreadable(const std::string& path, std::string error) {
    unreadable_[path] = std::move(error);
}

FetchResult
MemorySource::fetch(const std::string& path) {
    FetchResult result;
    if (auto it = unreadable_.find(path); it != unreadable_.end()) {
        result.status = FetchStatus::kUnreadable;
        result.error = it->second;
        return result;
    }
    auto it = files_.find(path);
    if (it == files_.end()) {
        result.status = FetchStatus::kAbsent;
        result.error = to_string(FetchStatus::kAbsent);
        return result;
    }
    result.data = it->second;
    return result;
}

const FetchResult&
Candidate::fetch() {
    if (!cached_) {
        cached_ = source_->fetch(path_);
    }
    return *cached_;
}

Relevance
checkfiles::check_relevance(const Policy& policy, Candidate& candidate) {
    const auto& path = candidate.path();

    if (policy_is_ignored_path(policy, path)) {
        return Relevance::kIgnoredPath;
    }
    if (policy_is_ignored_suffix(policy, path)) {
        return Relevance::kIgnoredSuffix;
    }
    if (!policy_is_checked_suffix(policy, path)) {
        return Relevance::kUncheckedSuffix;
    }

    const auto& fetched = candidate.fetch();
    switch (fetched.status) {
        case FetchStatus::kAbsent:
            return Relevance::kAbsent;
        case FetchStatus::kUnreadable:
            return Relevance::kUnreadable;
        case FetchStatus::kOk:
            break;
    }

    if (contains_nul(fetched.data)) {
        return Relevance::kBinary;
    }
    return Relevance::kRelevant;
}

bool
checkfiles::is_relevant(const Policy& policy, Candidate& candidate) {
    return check_relevance(policy, candidate) == Relevance::kRelevant;
}

std::string
checkfiles::to_string(Relevance relevance) {
    switch (relevance) {
        case Relevance::kRelevant:
            return "relevant";
        case Relevance::kIgnoredPath:
            return "explicit ignore";
        case Relevance::kIgnoredSuffix:
            return "ignored extension";
        case Relevance::kUncheckedSuffix:
            return "non-checked extension";
        case Relevance::kAbsent:
            return "deleted";
        case Relevance::kBinary:
            return "binary";
        case Relevance::kUnreadable:
            return "unreadable";
        default:
            return "unknown";
    }
}
