#pragma once

#include <gitsnip/result.hpp>
#include <gitsnip/git.hpp>
#include <gitsnip/selector.hpp>
#include <string>

namespace gitsnip {

// A selector pinned to one commit at one point in time
struct ResolvedRef {
    std::string commit;   // full hex commit id, lowercase
    std::string kind;     // effective selector kind used for the cache key
    std::string value;    // effective selector value (default branch filled in)
};

// Turns a selector into a commit id using ref listings only; never
// downloads object data.
class RefResolver {
public:
    explicit RefResolver(RemoteAccess& remote);

    // Commit selectors are taken as authoritative without contacting the
    // remote; their existence is only checked when the commit is fetched.
    Result<ResolvedRef> resolve(const std::string& url, const Selector& selector);

    // Short name of the remote's default branch, e.g. "main"
    Result<std::string> default_branch(const std::string& url);

private:
    Result<std::string> lookup(const std::string& url,
                               const std::string& refname,
                               const Selector& selector);

    RemoteAccess& remote_;
};

} // namespace gitsnip
