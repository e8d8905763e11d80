#include "test_helpers.hpp"

#include <gitsnip/fetcher.hpp>
#include <gitsnip/key.hpp>

using namespace gitsnip;
using namespace gitsnip::test;

namespace {

const std::string kUrl = "https://example.com/repo.git";

// Store, scratch space and a fake remote wired into one fetcher
struct FetcherFixture {
    TempDir td{"fetcher"};
    FakeRemote remote;
    SnippetStore store;
    Materializer materializer;
    SnippetFetcher fetcher;

    explicit FetcherFixture(FetcherOptions opts = {})
        : store(td.path / ".snippets"),
          materializer(remote, td.path / "scratch"),
          fetcher(remote, store, materializer, opts) {
        remote.refs["refs/heads/main"] = kCommitA;
        remote.trees[kCommitA] = {{"src/lib.txt", "version A\n"}};
    }

    FetchRequest request(const std::string& path = "src/lib.txt") const {
        FetchRequest req;
        req.git_url = kUrl;
        req.path = path;
        return req;
    }

    size_t scratch_entries() const {
        size_t n = 0;
        std::error_code ec;
        for (fs::directory_iterator it(td.path / "scratch", ec), end; !ec && it != end; ++it) ++n;
        return n;
    }
};

} // namespace

TEST_CASE("first run fetches and persists the snippet", "[fetcher]") {
    FetcherFixture fx;

    auto r = fx.fetcher.run(fx.request());
    REQUIRE(r.is_ok());
    const auto& out = r.value();
    REQUIRE_FALSE(out.up_to_date);
    REQUIRE(out.commit == kCommitA);
    REQUIRE(out.prefix == derive_key(kUrl, "branch", "main", "src/lib.txt"));
    REQUIRE(out.path == fx.td.path / ".snippets" / (out.prefix + "-" + kCommitA));
    REQUIRE(read_all(out.path) == "version A\n");
    REQUIRE(fx.remote.fetch_calls == 1);
    // Workspace is released once the snippet is written
    REQUIRE(fx.scratch_entries() == 0);
}

TEST_CASE("unchanged upstream is a cache hit with zero fetches", "[fetcher]") {
    FetcherFixture fx;

    auto first = fx.fetcher.run(fx.request());
    REQUIRE(first.is_ok());
    REQUIRE(fx.remote.fetch_calls == 1);

    auto second = fx.fetcher.run(fx.request());
    REQUIRE(second.is_ok());
    REQUIRE(second.value().up_to_date);
    REQUIRE(second.value().path == first.value().path);
    REQUIRE(fx.remote.fetch_calls == 1);
    REQUIRE(fx.remote.checkout_calls == 1);
}

TEST_CASE("moved branch replaces the stale snippet", "[fetcher]") {
    FetcherFixture fx;
    auto first = fx.fetcher.run(fx.request());
    REQUIRE(first.is_ok());

    fx.remote.refs["refs/heads/main"] = kCommitB;
    fx.remote.trees[kCommitB] = {{"src/lib.txt", "version B\n"}};

    auto second = fx.fetcher.run(fx.request());
    REQUIRE(second.is_ok());
    const auto& out = second.value();
    REQUIRE_FALSE(out.up_to_date);
    REQUIRE(out.commit == kCommitB);
    REQUIRE(out.previous_commit == kCommitA);
    REQUIRE(out.prefix == first.value().prefix);
    REQUIRE(read_all(out.path) == "version B\n");
    REQUIRE_FALSE(fs::exists(first.value().path));

    auto all = fx.store.list();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 1);
    REQUIRE(all.value()[0].commit == kCommitB);
}

TEST_CASE("conflicting selectors fail before any network call", "[fetcher]") {
    FetcherFixture fx;
    auto req = fx.request();
    req.branch = "main";
    req.tag = "v1";

    auto r = fx.fetcher.run(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SnipError::Validation);
    REQUIRE(fx.remote.network_calls() == 0);
    REQUIRE_FALSE(fs::exists(fx.td.path / ".snippets"));
}

TEST_CASE("missing path writes no record", "[fetcher]") {
    FetcherFixture fx;

    auto r = fx.fetcher.run(fx.request("src/absent.txt"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SnipError::FileNotFound);
    REQUIRE(fx.store.list().value().empty());
    REQUIRE(fx.scratch_entries() == 0);
}

TEST_CASE("failed refresh keeps the previous record", "[fetcher]") {
    FetcherFixture fx;
    auto first = fx.fetcher.run(fx.request());
    REQUIRE(first.is_ok());

    // Branch moves to a commit the remote then refuses to serve
    fx.remote.refs["refs/heads/main"] = kCommitC;

    auto second = fx.fetcher.run(fx.request());
    REQUIRE(second.is_err());
    REQUIRE(second.error().code == SnipError::Fetch);
    REQUIRE(read_all(first.value().path) == "version A\n");
    REQUIRE(fx.store.list().value().size() == 1);
}

TEST_CASE("resolution failure leaves the store untouched", "[fetcher]") {
    FetcherFixture fx;
    auto req = fx.request();
    req.tag = "missing";

    auto r = fx.fetcher.run(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SnipError::Resolution);
    REQUIRE(fx.remote.fetch_calls == 0);
    REQUIRE_FALSE(fs::exists(fx.td.path / ".snippets"));
}

TEST_CASE("commit selector skips ref lookups", "[fetcher]") {
    FetcherFixture fx;
    auto req = fx.request();
    req.commit_hash = kCommitA;

    auto r = fx.fetcher.run(req);
    REQUIRE(r.is_ok());
    REQUIRE(fx.remote.default_branch_calls == 0);
    REQUIRE(fx.remote.lookup_calls == 0);
    REQUIRE(r.value().prefix == derive_key(kUrl, "commit", kCommitA, "src/lib.txt"));
}

TEST_CASE("selectors with the same commit still get separate keys", "[fetcher]") {
    FetcherFixture fx;
    fx.remote.refs["refs/tags/v1"] = kCommitA;

    auto by_branch = fx.fetcher.run(fx.request());
    auto req = fx.request();
    req.tag = "v1";
    auto by_tag = fx.fetcher.run(req);

    REQUIRE(by_branch.is_ok());
    REQUIRE(by_tag.is_ok());
    REQUIRE(by_branch.value().prefix != by_tag.value().prefix);
    REQUIRE(fx.store.list().value().size() == 2);
}

TEST_CASE("keep_workspace leaves the checkout for temp cleanup", "[fetcher]") {
    FetcherOptions opts;
    opts.keep_workspace = true;
    FetcherFixture fx(opts);

    auto r = fx.fetcher.run(fx.request());
    REQUIRE(r.is_ok());
    REQUIRE(fx.scratch_entries() == 1);
}

TEST_CASE("empty url or path is a validation error", "[fetcher]") {
    FetcherFixture fx;
    auto no_url = fx.request();
    no_url.git_url.clear();
    REQUIRE(fx.fetcher.run(no_url).error().code == SnipError::Validation);
    REQUIRE(fx.fetcher.run(fx.request("")).error().code == SnipError::Validation);
    REQUIRE(fx.remote.network_calls() == 0);
}

// ===== End to end over file:// =====

TEST_CASE("end to end against a local repository", "[fetcher][integration]") {
    GitRepoFixture repo;
    std::string c1 = repo.commit_file("src/lib.txt", "first\n", "first");

    TempDir td{"e2e"};
    GitCli git;
    SnippetStore store(td.path / ".snippets", ".txt");
    Materializer materializer(git, td.path / "scratch");
    SnippetFetcher fetcher(git, store, materializer);

    FetchRequest req;
    req.git_url = repo.url();
    req.path = "src/lib.txt";

    auto first = fetcher.run(req);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().commit == c1);
    REQUIRE(first.value().path.filename().string() ==
            derive_key(repo.url(), "branch", "main", "src/lib.txt") + "-" + c1 + ".txt");
    REQUIRE(read_all(first.value().path) == "first\n");

    auto again = fetcher.run(req);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().up_to_date);
    REQUIRE(again.value().path == first.value().path);

    std::string c2 = repo.commit_file("src/lib.txt", "second\n", "second");
    auto updated = fetcher.run(req);
    REQUIRE(updated.is_ok());
    REQUIRE(updated.value().commit == c2);
    REQUIRE(updated.value().previous_commit == c1);
    REQUIRE(read_all(updated.value().path) == "second\n");
    REQUIRE_FALSE(fs::exists(first.value().path));

    // Pinning the old commit reads the old bytes under its own key
    req.commit_hash = c1;
    auto pinned = fetcher.run(req);
    REQUIRE(pinned.is_ok());
    REQUIRE(read_all(pinned.value().path) == "first\n");
    REQUIRE(store.list().value().size() == 2);

    REQUIRE(fs::is_empty(td.path / "scratch"));
}

TEST_CASE("a committed symlink to a host file is not cached", "[fetcher][integration]") {
    TempDir host{"host"};
    host.write_file("secret.txt", "HOST-ONLY\n");

    GitRepoFixture repo;
    repo.commit_file("README.md", "readme\n", "first");
    fs::create_symlink(host.path / "secret.txt", repo.repo / "link.txt");
    repo.git({"add", "link.txt"});
    repo.git({"commit", "-q", "-m", "link"});

    TempDir td{"e2e"};
    GitCli git;
    SnippetStore store(td.path / ".snippets", "");
    Materializer materializer(git, td.path / "scratch");
    SnippetFetcher fetcher(git, store, materializer);

    FetchRequest req;
    req.git_url = repo.url();
    req.path = "link.txt";

    auto r = fetcher.run(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SnipError::FileNotFound);
    REQUIRE(store.list().value().empty());
    REQUIRE(fs::is_empty(td.path / "scratch"));
}
