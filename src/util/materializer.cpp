#include <gitsnip/materializer.hpp>
#include <gitsnip/log.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace gitsnip {

Materializer::Materializer(RemoteAccess& remote, fs::path scratch_root)
    : remote_(remote), scratch_root_(std::move(scratch_root)) {
    if (scratch_root_.empty()) {
        std::error_code ec;
        scratch_root_ = fs::temp_directory_path(ec);
        if (ec) scratch_root_ = "/tmp";
    }
}

Result<WorkspaceHandle> Materializer::acquire() {
    std::error_code ec;
    fs::create_directories(scratch_root_, ec);
    if (ec) {
        return SnipError{SnipError::IO,
            "cannot create scratch root " + scratch_root_.string() + ": " + ec.message()};
    }

    std::string templ = (scratch_root_ / "gitsnip-XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return SnipError{SnipError::IO,
            "mkdtemp failed under " + scratch_root_.string() + ": " + strerror(errno)};
    }

    WorkspaceHandle handle;
    handle.root = fs::path(buf.data());
    gitsnip::log::debug("acquired workspace %s", handle.root.c_str());
    return Result<WorkspaceHandle>::ok(std::move(handle));
}

Result<WorkspaceHandle> Materializer::materialize(const std::string& url,
                                                  const std::string& commit) {
    auto acquired = acquire().wrap_err(SnipError::Fetch, "cannot prepare workspace");
    if (acquired.is_err()) return acquired;
    WorkspaceHandle handle = std::move(acquired).value();

    gitsnip::log::info("fetching %s at %s", url.c_str(), commit.c_str());
    auto fetched = remote_.fetch_commit(url, commit, handle.root.string());
    if (fetched.is_ok()) {
        fetched = remote_.checkout(handle.root.string(), commit);
    }

    if (fetched.is_err()) {
        SnipError err = std::move(fetched).error().wrap(SnipError::Fetch, "");
        auto rel = release(handle);
        if (rel.is_err()) {
            gitsnip::log::warn("%s", rel.error().message.c_str());
        }
        return err;
    }

    return Result<WorkspaceHandle>::ok(std::move(handle));
}

Result<std::string> Materializer::read_file(const WorkspaceHandle& handle,
                                            const std::string& relative_path) const {
    if (handle.released) {
        return SnipError{SnipError::InvalidArg,
            "workspace " + handle.root.string() + " was already released"};
    }

    fs::path rel = fs::path(relative_path).lexically_normal();
    if (relative_path.empty() || rel.is_absolute() || rel.empty() ||
        rel.begin()->string() == "..") {
        return SnipError{SnipError::FileNotFound,
            "'" + relative_path + "' is not a path inside the repository"};
    }
    // Never hand out git's own metadata as repository content
    if (rel.begin()->string() == ".git") {
        return SnipError{SnipError::FileNotFound,
            "'" + relative_path + "' does not exist in the checked-out tree"};
    }

    // Symlinks (on the file or any parent) are followed, but the final
    // target must still be a checkout file; anything else would read host
    // content that the commit does not determine
    std::error_code ec;
    fs::path root = fs::weakly_canonical(handle.root, ec);
    if (ec) {
        return SnipError{SnipError::IO,
            "cannot resolve workspace " + handle.root.string() + ": " + ec.message()};
    }
    fs::path full = fs::weakly_canonical(handle.root / rel, ec);
    if (ec) {
        return SnipError{SnipError::FileNotFound,
            "'" + relative_path + "' cannot be resolved: " + ec.message()};
    }
    fs::path inside = full.lexically_relative(root);
    if (inside.empty() || inside.begin()->string() == ".." ||
        inside.begin()->string() == ".git") {
        return SnipError{SnipError::FileNotFound,
            "'" + relative_path + "' points outside the checked-out tree"};
    }

    if (!fs::is_regular_file(full, ec)) {
        return SnipError{SnipError::FileNotFound,
            "'" + relative_path + "' does not exist in the checked-out tree"};
    }

    std::ifstream in(full, std::ios::binary);
    if (!in.is_open()) {
        return SnipError{SnipError::IO, "cannot open " + full.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return SnipError{SnipError::IO, "error reading " + full.string()};
    }
    return Result<std::string>::ok(ss.str());
}

Status Materializer::release(WorkspaceHandle& handle) {
    if (handle.released) return ok_status();
    handle.released = true;

    std::error_code ec;
    fs::remove_all(handle.root, ec);
    if (ec) {
        return SnipError{SnipError::IO,
            "failed to remove workspace " + handle.root.string() + ": " + ec.message()};
    }
    gitsnip::log::debug("released workspace %s", handle.root.c_str());
    return ok_status();
}

} // namespace gitsnip
