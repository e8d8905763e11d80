#include <CLI/CLI.hpp>

#include <gitsnip/config.hpp>
#include <gitsnip/fetcher.hpp>
#include <gitsnip/git.hpp>
#include <gitsnip/log.hpp>
#include <gitsnip/materializer.hpp>
#include <gitsnip/store.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace gitsnip;

namespace {

struct CliOptions {
    std::string git_url;
    std::string path;
    std::string branch;
    std::string tag;
    std::string commit_hash;
    std::string snippets_dir;
    std::string extension;
    std::string config_file;
    int timeout = 0;
    bool keep_workspace = false;
    bool list = false;
    bool verbose = false;
    bool quiet = false;
};

int fail(const SnipError& err) {
    gitsnip::log::error("%s", err.format().c_str());
    return 1;
}

// global -> project (or --config) -> command line
Result<Config> load_config(const CLI::App& app, const CliOptions& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    std::optional<Config> project;
    std::string project_path = opts.config_file.empty()
        ? std::string(project_config_name()) : opts.config_file;
    if (!opts.config_file.empty() || fs::exists(project_path)) {
        auto p = Config::load(project_path);
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }

    Config cfg = Config::effective(global, project);

    if (app.count("--snippets-dir")) cfg.snippets_dir = opts.snippets_dir;
    if (app.count("--ext")) {
        if (opts.extension.find('-') != std::string::npos) {
            return SnipError{SnipError::Config,
                "--ext '" + opts.extension + "' must not contain '-'"};
        }
        cfg.extension = opts.extension;
    }
    if (app.count("--timeout")) cfg.timeout_seconds = opts.timeout;
    if (opts.keep_workspace) cfg.keep_workspace = true;
    if (opts.verbose) cfg.log_level = log::Debug;
    if (opts.quiet) cfg.log_level = log::Warn;

    return Result<Config>::ok(std::move(cfg));
}

int list_snippets(const Config& cfg) {
    SnippetStore store(cfg.snippets_dir, cfg.extension);
    auto records = store.list();
    if (records.is_err()) return fail(records.error());

    for (const auto& rec : records.value()) {
        std::cout << rec.commit << "  " << rec.path.string() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"gitsnip - cache one file from a remote git repository"};

    CliOptions opts;

    app.add_option("--git", opts.git_url, "Repository URL");
    app.add_option("--path", opts.path, "File path inside the repository");
    auto* branch_opt = app.add_option("--branch", opts.branch, "Branch to read from");
    auto* tag_opt = app.add_option("--tag", opts.tag, "Tag to read from");
    auto* commit_opt = app.add_option("--commit-hash", opts.commit_hash,
                                      "Exact commit to read from");
    app.add_option("--snippets-dir", opts.snippets_dir, "Snippet cache directory");
    app.add_option("--ext", opts.extension, "Extension appended to snippet names");
    app.add_option("--config", opts.config_file, "Config file used instead of ./.gitsnip.toml")
        ->check(CLI::ExistingFile);
    app.add_option("--timeout", opts.timeout, "Timeout for each git invocation, in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("--keep-workspace", opts.keep_workspace,
                 "Leave the fetch workspace in the temp directory");
    app.add_flag("--list", opts.list, "List cached snippets and exit");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Only warnings and errors");

    CLI11_PARSE(app, argc, argv);

    auto cfg = load_config(app, opts);
    if (cfg.is_err()) return fail(cfg.error());
    gitsnip::log::set_level(cfg.value().log_level);

    if (opts.list) {
        return list_snippets(cfg.value());
    }

    FetchRequest request;
    request.git_url = opts.git_url;
    request.path = opts.path;
    if (branch_opt->count()) request.branch = opts.branch;
    if (tag_opt->count()) request.tag = opts.tag;
    if (commit_opt->count()) request.commit_hash = opts.commit_hash;

    if (request.git_url.empty() || request.path.empty()) {
        return fail(SnipError{SnipError::Validation,
            "--git and --path are required", "see --help"});
    }
    // Conflicting selectors are rejected before any git process is started
    auto selector = Selector::from_flags(request.branch, request.tag, request.commit_hash);
    if (selector.is_err()) return fail(selector.error());

    GitCli git;
    git.set_timeout(cfg.value().timeout_seconds);
    auto version = git.check_version();
    if (version.is_err()) return fail(version.error());
    gitsnip::log::debug("using git %s", version.value().c_str());

    SnippetStore store(cfg.value().snippets_dir, cfg.value().extension);
    Materializer materializer(git, cfg.value().scratch_dir);

    FetcherOptions fopts;
    fopts.keep_workspace = cfg.value().keep_workspace;
    SnippetFetcher fetcher(git, store, materializer, fopts);

    auto outcome = fetcher.run(request);
    if (outcome.is_err()) return fail(outcome.error());

    const FetchOutcome& out = outcome.value();
    gitsnip::log::info("commit: %s", out.commit.c_str());
    if (!out.previous_commit.empty()) {
        gitsnip::log::info("replaced snippet from %s", out.previous_commit.c_str());
    }
    std::cout << out.path.string() << std::endl;
    return 0;
}
