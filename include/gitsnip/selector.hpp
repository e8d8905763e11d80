#pragma once

#include <gitsnip/result.hpp>
#include <optional>
#include <string>

namespace gitsnip {

// Which point in history a request refers to
struct Selector {
    enum Kind { Branch, Tag, Commit, DefaultBranch };

    Kind kind = DefaultBranch;
    std::string value;  // empty for DefaultBranch

    static Selector branch(std::string name);
    static Selector tag(std::string name);
    static Selector commit(std::string sha);
    static Selector default_branch();

    // Build from the three mutually exclusive request flags.
    // Validation error if more than one is supplied or a supplied one is empty.
    static Result<Selector> from_flags(const std::optional<std::string>& branch,
                                       const std::optional<std::string>& tag,
                                       const std::optional<std::string>& commit_hash);

    // "branch", "tag" or "commit"; DefaultBranch reports "branch"
    const char* kind_name() const;

    // Human-readable form for messages, e.g. "tag 'v1.0'"
    std::string describe() const;

    bool operator==(const Selector& other) const {
        return kind == other.kind && value == other.value;
    }
};

// True for a full-length hex commit id (40 for SHA-1, 64 for SHA-256 repos)
bool is_commit_hash(const std::string& s);

} // namespace gitsnip
