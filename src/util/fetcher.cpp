#include <gitsnip/fetcher.hpp>
#include <gitsnip/key.hpp>
#include <gitsnip/log.hpp>

namespace gitsnip {

SnippetFetcher::SnippetFetcher(RemoteAccess& remote, SnippetStore& store,
                               Materializer& materializer, FetcherOptions options)
    : resolver_(remote), store_(store), materializer_(materializer),
      options_(options) {}

Result<std::string> SnippetFetcher::fetch_content(const std::string& url,
                                                  const std::string& commit,
                                                  const std::string& path) {
    auto ws = materializer_.materialize(url, commit);
    if (ws.is_err()) return std::move(ws).error();
    WorkspaceHandle handle = std::move(ws).value();

    auto content = materializer_.read_file(handle, path);

    if (content.is_err() || !options_.keep_workspace) {
        auto rel = materializer_.release(handle);
        if (rel.is_err()) {
            gitsnip::log::warn("%s", rel.error().message.c_str());
        }
    } else {
        gitsnip::log::debug("keeping workspace %s", handle.root.c_str());
    }

    return content;
}

Result<FetchOutcome> SnippetFetcher::run(const FetchRequest& request) {
    if (request.git_url.empty()) {
        return SnipError{SnipError::Validation, "--git must not be empty"};
    }
    if (request.path.empty()) {
        return SnipError{SnipError::Validation, "--path must not be empty"};
    }

    auto selector = Selector::from_flags(request.branch, request.tag, request.commit_hash);
    if (selector.is_err()) return std::move(selector).error();

    gitsnip::log::info("resolving %s of %s",
                       selector.value().describe().c_str(), request.git_url.c_str());
    auto resolved = resolver_.resolve(request.git_url, selector.value());
    if (resolved.is_err()) return std::move(resolved).error();
    const ResolvedRef& ref = resolved.value();
    gitsnip::log::info("found commit %s", ref.commit.c_str());

    FetchOutcome outcome;
    outcome.prefix = derive_key(request.git_url, ref.kind, ref.value, request.path);
    outcome.commit = ref.commit;

    auto existing = store_.find_by_prefix(outcome.prefix);
    if (existing.is_err()) return std::move(existing).error();

    if (existing.value()) {
        const SnippetRecord& rec = *existing.value();
        if (SnippetStore::is_fresh(rec, ref.commit)) {
            gitsnip::log::info("snippet is up to date at %s", rec.path.c_str());
            outcome.path = rec.path;
            outcome.up_to_date = true;
            return Result<FetchOutcome>::ok(std::move(outcome));
        }
        gitsnip::log::info("snippet is stale (cached %s, upstream %s), updating",
                           rec.commit.c_str(), ref.commit.c_str());
        outcome.previous_commit = rec.commit;
    }

    auto content = fetch_content(request.git_url, ref.commit, request.path);
    if (content.is_err()) return std::move(content).error();

    auto stored = store_.put(outcome.prefix, ref.commit, content.value());
    if (stored.is_err()) return std::move(stored).error();

    outcome.path = stored.value().path;
    gitsnip::log::info("snippet saved to %s", outcome.path.c_str());
    return Result<FetchOutcome>::ok(std::move(outcome));
}

} // namespace gitsnip
