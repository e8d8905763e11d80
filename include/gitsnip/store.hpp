#pragma once

#include <gitsnip/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitsnip {

// One cached extraction: <dir>/<prefix>-<commit><extension>
struct SnippetRecord {
    std::string prefix;
    std::string commit;
    std::string file_name;
    std::filesystem::path path;
};

// Directory of immutable snippet files, at most one per key prefix.
// Assumes a single writer per directory.
class SnippetStore {
public:
    explicit SnippetStore(std::filesystem::path dir, std::string extension = "");

    // Record whose name starts with `prefix`, or nullopt. A missing
    // directory is an empty store, not an error.
    Result<std::optional<SnippetRecord>> find_by_prefix(const std::string& prefix) const;

    // All records in the store, sorted by file name
    Result<std::vector<SnippetRecord>> list() const;

    // Publish `content` as the record for `prefix` at `commit`. The bytes are
    // staged under a hidden temp name first; any previous record for the
    // prefix is removed right before the staged file is renamed into place.
    // If staging fails the previous record is left untouched.
    Result<SnippetRecord> put(const std::string& prefix,
                              const std::string& commit,
                              const std::string& content);

    Status remove_if_present(const std::string& prefix);

    // Fresh iff the embedded commit equals the freshly resolved one
    static bool is_fresh(const SnippetRecord& record, const std::string& commit) {
        return record.commit == commit;
    }

    std::string record_name(const std::string& prefix, const std::string& commit) const;

    // Commit id embedded in a record file name: the last hyphen-delimited
    // segment once the extension is stripped
    std::optional<std::string> commit_from_name(const std::string& file_name) const;

    const std::filesystem::path& dir() const { return dir_; }
    const std::string& extension() const { return extension_; }

private:
    Result<std::vector<std::string>> matching_names(const std::string& prefix) const;

    std::filesystem::path dir_;
    std::string extension_;
};

} // namespace gitsnip
