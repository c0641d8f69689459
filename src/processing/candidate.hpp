#pragma once

/*
    Candidate files and the sources their content is fetched from.

    A Candidate binds a path to one ContentSource and fetches its content at
    most once; the cached bytes are shared by the relevance gates, the
    scanner and the fixer. The same path in two different sources makes two
    distinct candidates.
*/

#include "policy.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace checkfiles {

enum class FetchStatus {
    kOk,
    kAbsent,
    kUnreadable,
};

struct FetchResult {
    FetchStatus status = FetchStatus::kOk;
    std::string data;
    std::string error;
};

std::string
to_string(FetchStatus status);

class ContentSource {
   public:
    virtual ~ContentSource() = default;

    virtual FetchResult
    fetch(const std::string& path) = 0;

    // Used in the run summary, i.e "working directory" or a revision name.
    virtual std::string
    name() const = 0;
};

// Files on disk, relative to a root directory.
class WorkingDirectorySource : public ContentSource {
   public:
    explicit WorkingDirectorySource(std::filesystem::path root);

    FetchResult
    fetch(const std::string& path) override;

    std::string
    name() const override {
        return "working directory";
    }

    std::filesystem::path
    full_path(const std::string& path) const;

   private:
    std::filesystem::path root_;
};

// Content held in memory; a revision handed over by a version control
// system, or test data.
class MemorySource : public ContentSource {
   public:
    explicit MemorySource(std::string name) : name_(std::move(name)) {
    }

    void
    add(const std::string& path, std::string data);

    void
    add_unreadable(const std::string& path, std::string error);

    FetchResult
    fetch(const std::string& path) override;

    std::string
    name() const override {
        return name_;
    }

   private:
    std::string name_;
    std::map<std::string, std::string> files_;
    std::map<std::string, std::string> unreadable_;
};

class Candidate {
   public:
    Candidate(std::string path, ContentSource& source) : path_(std::move(path)), source_(&source) {
    }

    const std::string&
    path() const {
        return path_;
    }

    // Fetches on first use, then returns the cached result.
    const FetchResult&
    fetch();

    const std::string&
    content() {
        return fetch().data;
    }

   private:
    std::string path_;
    ContentSource* source_;
    std::optional<FetchResult> cached_;
};

// Outcome of the relevance gates, in the order they are tested.
enum class Relevance {
    kRelevant,
    kIgnoredPath,
    kIgnoredSuffix,
    kUncheckedSuffix,
    kAbsent,
    kBinary,
    kUnreadable,
};

Relevance
check_relevance(const Policy& policy, Candidate& candidate);

bool
is_relevant(const Policy& policy, Candidate& candidate);

// Reason for debug output, i.e "ignoring foo.o (non-checked extension)".
std::string
to_string(Relevance relevance);

}  // namespace checkfiles
