#pragma once

#include <gitsnip/result.hpp>
#include <gitsnip/git.hpp>
#include <filesystem>
#include <string>

namespace gitsnip {

// Private scratch directory holding one checked-out commit. Not removed by
// its destructor: the owner calls Materializer::release() exactly once, or
// leaves it for the system's temp cleanup.
struct WorkspaceHandle {
    std::filesystem::path root;
    bool released = false;
};

// Minimal single-commit fetch + checkout into an ephemeral workspace
class Materializer {
public:
    explicit Materializer(RemoteAccess& remote,
                          std::filesystem::path scratch_root = {});

    // Create an empty gitsnip-XXXXXX directory under the scratch root
    Result<WorkspaceHandle> acquire();

    // acquire() + depth-1 fetch of `commit` + detached checkout.
    // On failure the workspace has already been released.
    Result<WorkspaceHandle> materialize(const std::string& url,
                                        const std::string& commit);

    // Raw bytes of `relative_path` inside the workspace. FileNotFound if the
    // path is absent, not a regular file, or escapes the workspace.
    Result<std::string> read_file(const WorkspaceHandle& handle,
                                  const std::string& relative_path) const;

    // Remove the workspace; a second call is a no-op
    Status release(WorkspaceHandle& handle);

    const std::filesystem::path& scratch_root() const { return scratch_root_; }

private:
    RemoteAccess& remote_;
    std::filesystem::path scratch_root_;
};

} // namespace gitsnip
