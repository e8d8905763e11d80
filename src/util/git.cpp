#include <gitsnip/git.hpp>
#include <gitsnip/log.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitsnip {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const EnvVars& env) {
    if (args.empty()) {
        return SnipError{SnipError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return SnipError{SnipError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return SnipError{SnipError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return SnipError{SnipError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        for (const auto& [key, val] : env) {
            setenv(key.c_str(), val.c_str(), 1);
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return SnipError{SnipError::IO,
                "'" + args[0] + "' timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return SnipError{SnipError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

// ---------------------------------------------------------------------------
// ls-remote parsing (pure functions)
// ---------------------------------------------------------------------------

static std::string trim_trailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                          s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

Result<std::string> parse_symref_head(const std::string& ls_remote_output) {
    // --symref adds a line of the form "ref: refs/heads/main\tHEAD"
    std::istringstream stream(ls_remote_output);
    std::string line;
    const std::string marker = "ref: ";

    while (std::getline(stream, line)) {
        line = trim_trailing(line);
        if (line.compare(0, marker.size(), marker) != 0) continue;

        auto tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;
        if (line.substr(tab_pos + 1) != "HEAD") continue;

        std::string target = line.substr(marker.size(), tab_pos - marker.size());
        if (!target.empty()) {
            return Result<std::string>::ok(std::move(target));
        }
    }

    return SnipError{SnipError::Resolution,
        "remote does not advertise a default branch",
        "pass --branch, --tag or --commit-hash explicitly"};
}

Result<std::string> parse_ls_remote_ref(const std::string& ls_remote_output,
                                        const std::string& refname) {
    // "<sha>\t<ref>", annotated tags add "<sha>\t<ref>^{}"
    std::istringstream stream(ls_remote_output);
    std::string line;
    const std::string peeled_name = refname + "^{}";
    std::string direct, peeled;

    while (std::getline(stream, line)) {
        line = trim_trailing(line);
        auto tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        std::string sha = line.substr(0, tab_pos);
        std::string ref = line.substr(tab_pos + 1);
        if (ref == refname) {
            direct = sha;
        } else if (ref == peeled_name) {
            peeled = sha;
        }
    }

    if (!peeled.empty()) return Result<std::string>::ok(std::move(peeled));
    if (!direct.empty()) return Result<std::string>::ok(std::move(direct));

    return SnipError{SnipError::Resolution,
        "remote has no ref '" + refname + "'"};
}

std::string absolute_local_url(const std::string& url) {
    if (url.empty() || url.find("://") != std::string::npos) return url;

    // git reads "host:path" as scp syntax when the colon precedes any slash
    auto colon = url.find(':');
    if (colon != std::string::npos && colon < url.find('/')) return url;

    std::error_code ec;
    auto abs = std::filesystem::absolute(url, ec);
    if (ec) return url;
    return abs.lexically_normal().string();
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::git(const std::vector<std::string>& args) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back("git");
    full.insert(full.end(), args.begin(), args.end());

    // Never block on a credential prompt; auth failures must fail the call
    return run_command(full, "", timeout_seconds_,
                       {{"GIT_TERMINAL_PROMPT", "0"}, {"GCM_INTERACTIVE", "never"}});
}

Result<std::string> GitCli::check_version() {
    auto r = git({"--version"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SnipError{SnipError::IO,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return SnipError{SnipError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (std::sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return SnipError{SnipError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return SnipError{SnipError::IO,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Result<std::string> GitCli::default_branch(const std::string& url) {
    gitsnip::log::debug("git ls-remote --symref %s HEAD", url.c_str());
    auto r = git({"ls-remote", "--symref", url, "HEAD"})
                 .wrap_err(SnipError::Resolution, "ls-remote");
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SnipError{SnipError::Resolution,
            "git ls-remote failed: " + trim_trailing(cmd.stderr_str)};
    }

    return parse_symref_head(cmd.stdout_str);
}

Result<std::string> GitCli::lookup_ref(const std::string& url,
                                       const std::string& refname) {
    gitsnip::log::debug("git ls-remote %s %s", url.c_str(), refname.c_str());
    auto r = git({"ls-remote", url, refname, refname + "^{}"})
                 .wrap_err(SnipError::Resolution, "ls-remote");
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SnipError{SnipError::Resolution,
            "git ls-remote failed: " + trim_trailing(cmd.stderr_str)};
    }

    return parse_ls_remote_ref(cmd.stdout_str, refname);
}

Status GitCli::fetch_commit(const std::string& url,
                            const std::string& commit,
                            const std::string& repo_dir) {
    gitsnip::log::debug("git init %s", repo_dir.c_str());
    auto init = git({"init", "-q", repo_dir}).wrap_err(SnipError::Fetch, "git init");
    if (init.is_err()) return std::move(init).error();
    if (init.value().exit_code != 0) {
        return SnipError{SnipError::Fetch,
            "git init failed: " + trim_trailing(init.value().stderr_str)};
    }

    // fetch runs inside repo_dir, so a local path must not stay relative
    // to our own working directory
    std::string source = absolute_local_url(url);

    // Name the exact commit, not a branch, so only its object graph at
    // depth 1 is transferred
    gitsnip::log::debug("git -C %s fetch --depth 1 %s %s",
                        repo_dir.c_str(), source.c_str(), commit.c_str());
    auto r = git({"-C", repo_dir, "fetch", "-q", "--depth", "1", "--no-tags",
                  source, commit}).wrap_err(SnipError::Fetch, "git fetch");
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SnipError{SnipError::Fetch,
            "git fetch of " + commit + " failed: " + trim_trailing(cmd.stderr_str),
            "the commit may not exist or the server may not allow fetching it by id"};
    }

    return ok_status();
}

Status GitCli::checkout(const std::string& repo_dir, const std::string& commit) {
    gitsnip::log::debug("git -C %s checkout --detach %s",
                        repo_dir.c_str(), commit.c_str());
    auto r = git({"-C", repo_dir, "-c", "advice.detachedHead=false",
                  "checkout", "-q", "--detach", commit})
                 .wrap_err(SnipError::Fetch, "git checkout");
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SnipError{SnipError::Fetch,
            "git checkout of " + commit + " failed: " + trim_trailing(cmd.stderr_str)};
    }

    return ok_status();
}

} // namespace gitsnip
