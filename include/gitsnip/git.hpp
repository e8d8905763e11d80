#pragma once

#include <gitsnip/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace gitsnip {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Run an external command, capturing stdout and stderr.
// `env` entries are set in the child only.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const EnvVars& env = {});

// Parse `git ls-remote --symref <url> HEAD` output and return the ref HEAD
// points at (e.g. "refs/heads/main"). NotFound if the remote advertises none.
Result<std::string> parse_symref_head(const std::string& ls_remote_output);

// Find `refname` in `git ls-remote` output and return its commit id.
// A peeled entry ("<refname>^{}") wins over the plain one, so annotated
// tags resolve to the commit rather than the tag object.
Result<std::string> parse_ls_remote_ref(const std::string& ls_remote_output,
                                        const std::string& refname);

// Local-path URLs ("./up", "../repo", "repo") are made absolute against the
// current directory; URLs with a scheme or in scp form (host:path) are
// returned unchanged.
std::string absolute_local_url(const std::string& url);

// What the core needs from a remote: reference discovery without object
// transfer, a depth-limited fetch of one commit, and a tree checkout.
// Each call is synchronous.
class RemoteAccess {
public:
    virtual ~RemoteAccess() = default;

    // Full ref name the remote HEAD points at, e.g. "refs/heads/main"
    virtual Result<std::string> default_branch(const std::string& url) = 0;

    // Commit id a full ref name peels to
    virtual Result<std::string> lookup_ref(const std::string& url,
                                           const std::string& refname) = 0;

    // Init a repository at `repo_dir` and fetch only `commit` (depth 1)
    virtual Status fetch_commit(const std::string& url,
                                const std::string& commit,
                                const std::string& repo_dir) = 0;

    // Materialize the tree of `commit` into the working dir of `repo_dir`
    virtual Status checkout(const std::string& repo_dir,
                            const std::string& commit) = 0;
};

// RemoteAccess backed by the git executable
class GitCli : public RemoteAccess {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    Result<std::string> default_branch(const std::string& url) override;
    Result<std::string> lookup_ref(const std::string& url,
                                   const std::string& refname) override;
    Status fetch_commit(const std::string& url,
                        const std::string& commit,
                        const std::string& repo_dir) override;
    Status checkout(const std::string& repo_dir,
                    const std::string& commit) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    Result<CommandResult> git(const std::vector<std::string>& args);

    int timeout_seconds_ = 60;
};

} // namespace gitsnip
