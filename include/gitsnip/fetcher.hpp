#pragma once

#include <gitsnip/result.hpp>
#include <gitsnip/git.hpp>
#include <gitsnip/materializer.hpp>
#include <gitsnip/resolver.hpp>
#include <gitsnip/store.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace gitsnip {

// One request as it arrives from the command line. The selector flags are
// validated by SnippetFetcher::run before anything touches the network.
struct FetchRequest {
    std::string git_url;
    std::string path;
    std::optional<std::string> branch;
    std::optional<std::string> tag;
    std::optional<std::string> commit_hash;
};

struct FetchOutcome {
    std::filesystem::path path;       // the cached artifact
    std::string prefix;
    std::string commit;
    std::string previous_commit;      // set when a stale record was replaced
    bool up_to_date = false;          // true when no content fetch happened
};

struct FetcherOptions {
    // Leave the fetch workspace on disk for the system's temp cleanup
    // instead of removing it once the snippet is written
    bool keep_workspace = false;
};

// Validate -> resolve -> derive key -> check cache -> fetch -> persist
class SnippetFetcher {
public:
    SnippetFetcher(RemoteAccess& remote, SnippetStore& store,
                   Materializer& materializer, FetcherOptions options = {});

    Result<FetchOutcome> run(const FetchRequest& request);

private:
    Result<std::string> fetch_content(const std::string& url,
                                      const std::string& commit,
                                      const std::string& path);

    RefResolver resolver_;
    SnippetStore& store_;
    Materializer& materializer_;
    FetcherOptions options_;
};

} // namespace gitsnip
