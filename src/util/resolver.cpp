#include <gitsnip/resolver.hpp>
#include <gitsnip/log.hpp>

#include <algorithm>
#include <cctype>

namespace gitsnip {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

RefResolver::RefResolver(RemoteAccess& remote)
    : remote_(remote) {}

Result<std::string> RefResolver::default_branch(const std::string& url) {
    gitsnip::log::info("fetching remote references for %s", url.c_str());
    auto head = remote_.default_branch(url).wrap_err(SnipError::Resolution,
        "cannot determine default branch of " + url);
    if (head.is_err()) return head;

    std::string name = head.value();
    const std::string heads = "refs/heads/";
    if (name.compare(0, heads.size(), heads) == 0) {
        name = name.substr(heads.size());
    }
    if (name.empty()) {
        return SnipError{SnipError::Resolution,
            "remote " + url + " reported an empty default branch"};
    }

    gitsnip::log::info("default branch: %s", name.c_str());
    return Result<std::string>::ok(std::move(name));
}

Result<std::string> RefResolver::lookup(const std::string& url,
                                        const std::string& refname,
                                        const Selector& selector) {
    auto sha = remote_.lookup_ref(url, refname).wrap_err(SnipError::Resolution,
        "cannot resolve " + selector.describe() + " at " + url);
    if (sha.is_err()) return sha;
    if (!is_commit_hash(sha.value())) {
        return SnipError{SnipError::Resolution,
            "remote returned malformed commit id '" + sha.value() + "' for "
            + selector.describe()};
    }
    return Result<std::string>::ok(to_lower(sha.value()));
}

Result<ResolvedRef> RefResolver::resolve(const std::string& url,
                                         const Selector& selector) {
    switch (selector.kind) {
        case Selector::Commit: {
            if (!is_commit_hash(selector.value)) {
                return SnipError{SnipError::Resolution,
                    "malformed commit hash '" + selector.value + "'",
                    "expected 40 (or 64) hexadecimal characters"};
            }
            return Result<ResolvedRef>::ok(
                ResolvedRef{to_lower(selector.value), "commit", selector.value});
        }

        case Selector::Tag: {
            auto sha = lookup(url, "refs/tags/" + selector.value, selector);
            if (sha.is_err()) return std::move(sha).error();
            return Result<ResolvedRef>::ok(
                ResolvedRef{std::move(sha).value(), "tag", selector.value});
        }

        case Selector::Branch: {
            auto sha = lookup(url, "refs/heads/" + selector.value, selector);
            if (sha.is_err()) return std::move(sha).error();
            return Result<ResolvedRef>::ok(
                ResolvedRef{std::move(sha).value(), "branch", selector.value});
        }

        case Selector::DefaultBranch: {
            auto name = default_branch(url);
            if (name.is_err()) return std::move(name).error();
            return resolve(url, Selector::branch(name.value()));
        }
    }

    return SnipError{SnipError::InvalidArg, "unknown selector kind"};
}

} // namespace gitsnip
