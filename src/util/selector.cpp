#include <gitsnip/selector.hpp>

#include <cctype>

namespace gitsnip {

// Users sometimes type the full ref; the key and lookup want the short name
static std::string strip_ref_namespace(std::string name, const std::string& ns) {
    if (name.size() > ns.size() && name.compare(0, ns.size(), ns) == 0) {
        return name.substr(ns.size());
    }
    return name;
}

Selector Selector::branch(std::string name) {
    return Selector{Branch, strip_ref_namespace(std::move(name), "refs/heads/")};
}

Selector Selector::tag(std::string name) {
    return Selector{Tag, strip_ref_namespace(std::move(name), "refs/tags/")};
}

Selector Selector::commit(std::string sha) {
    return Selector{Commit, std::move(sha)};
}

Selector Selector::default_branch() {
    return Selector{DefaultBranch, ""};
}

Result<Selector> Selector::from_flags(const std::optional<std::string>& branch,
                                      const std::optional<std::string>& tag,
                                      const std::optional<std::string>& commit_hash) {
    int supplied = int(branch.has_value()) + int(tag.has_value())
                 + int(commit_hash.has_value());
    if (supplied > 1) {
        return SnipError{SnipError::Validation,
            "only one of --branch, --tag or --commit-hash can be specified"};
    }

    if (branch) {
        if (branch->empty()) {
            return SnipError{SnipError::Validation, "--branch needs a non-empty name"};
        }
        return Result<Selector>::ok(Selector::branch(*branch));
    }
    if (tag) {
        if (tag->empty()) {
            return SnipError{SnipError::Validation, "--tag needs a non-empty name"};
        }
        return Result<Selector>::ok(Selector::tag(*tag));
    }
    if (commit_hash) {
        if (commit_hash->empty()) {
            return SnipError{SnipError::Validation, "--commit-hash needs a non-empty value"};
        }
        return Result<Selector>::ok(Selector::commit(*commit_hash));
    }
    return Result<Selector>::ok(Selector::default_branch());
}

const char* Selector::kind_name() const {
    switch (kind) {
        case Branch:        return "branch";
        case Tag:           return "tag";
        case Commit:        return "commit";
        case DefaultBranch: return "branch";
    }
    return "branch";
}

std::string Selector::describe() const {
    if (kind == DefaultBranch) return "default branch";
    return std::string(kind_name()) + " '" + value + "'";
}

bool is_commit_hash(const std::string& s) {
    if (s.size() != 40 && s.size() != 64) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace gitsnip
