#include <gitsnip/store.hpp>
#include <gitsnip/log.hpp>

#include <algorithm>
#include <fstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace gitsnip {

SnippetStore::SnippetStore(fs::path dir, std::string extension)
    : dir_(std::move(dir)), extension_(std::move(extension)) {}

std::string SnippetStore::record_name(const std::string& prefix,
                                      const std::string& commit) const {
    return prefix + "-" + commit + extension_;
}

std::optional<std::string> SnippetStore::commit_from_name(const std::string& file_name) const {
    std::string stem = file_name;
    if (!extension_.empty()) {
        if (stem.size() <= extension_.size() ||
            stem.compare(stem.size() - extension_.size(), extension_.size(), extension_) != 0) {
            return std::nullopt;
        }
        stem.resize(stem.size() - extension_.size());
    }

    auto dash = stem.rfind('-');
    if (dash == std::string::npos || dash + 1 == stem.size()) return std::nullopt;
    return stem.substr(dash + 1);
}

Result<std::vector<std::string>> SnippetStore::matching_names(const std::string& prefix) const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    const std::string lead = prefix + "-";
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        return SnipError{SnipError::Storage,
            "cannot read snippet directory " + dir_.string() + ": " + ec.message()};
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, lead.size(), lead) != 0) continue;

        auto commit = commit_from_name(name);
        if (!commit) continue;
        // The commit must be the whole remainder; anything else belongs to
        // a different key that merely shares the leading text
        if (name != record_name(prefix, *commit)) continue;

        names.push_back(std::move(name));
    }

    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<std::optional<SnippetRecord>> SnippetStore::find_by_prefix(const std::string& prefix) const {
    auto names = matching_names(prefix);
    if (names.is_err()) return std::move(names).error();

    const auto& found = names.value();
    if (found.empty()) {
        return Result<std::optional<SnippetRecord>>::ok(std::nullopt);
    }
    if (found.size() > 1) {
        gitsnip::log::warn("%zu snippets share prefix %s, using %s",
                           found.size(), prefix.c_str(), found.front().c_str());
    }

    SnippetRecord rec;
    rec.prefix = prefix;
    rec.commit = *commit_from_name(found.front());
    rec.file_name = found.front();
    rec.path = dir_ / rec.file_name;
    return Result<std::optional<SnippetRecord>>::ok(std::move(rec));
}

Result<std::vector<SnippetRecord>> SnippetStore::list() const {
    std::vector<SnippetRecord> records;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return Result<std::vector<SnippetRecord>>::ok(std::move(records));
    }

    fs::directory_iterator it(dir_, ec);
    if (ec) {
        return SnipError{SnipError::Storage,
            "cannot read snippet directory " + dir_.string() + ": " + ec.message()};
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;  // staged temp files
        if (!entry.is_regular_file(ec)) continue;

        auto commit = commit_from_name(name);
        if (!commit) continue;

        SnippetRecord rec;
        rec.commit = *commit;
        rec.prefix = name.substr(0, name.size() - extension_.size() - commit->size() - 1);
        rec.file_name = name;
        rec.path = entry.path();
        records.push_back(std::move(rec));
    }

    std::sort(records.begin(), records.end(),
              [](const SnippetRecord& a, const SnippetRecord& b) {
                  return a.file_name < b.file_name;
              });
    return Result<std::vector<SnippetRecord>>::ok(std::move(records));
}

Status SnippetStore::remove_if_present(const std::string& prefix) {
    auto names = matching_names(prefix);
    if (names.is_err()) return std::move(names).error();

    for (const auto& name : names.value()) {
        std::error_code ec;
        fs::remove(dir_ / name, ec);
        if (ec) {
            return SnipError{SnipError::Storage,
                "failed to remove stale snippet " + name + ": " + ec.message()};
        }
        gitsnip::log::debug("removed snippet %s", name.c_str());
    }
    return ok_status();
}

Result<SnippetRecord> SnippetStore::put(const std::string& prefix,
                                        const std::string& commit,
                                        const std::string& content) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return SnipError{SnipError::Storage,
            "cannot create snippet directory " + dir_.string() + ": " + ec.message()};
    }

    SnippetRecord rec;
    rec.prefix = prefix;
    rec.commit = commit;
    rec.file_name = record_name(prefix, commit);
    rec.path = dir_ / rec.file_name;

    // Leading dot keeps the staged file out of prefix scans
    fs::path staged = dir_ / ("." + rec.file_name + ".tmp-" + std::to_string(getpid()));
    {
        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return SnipError{SnipError::Storage,
                "cannot write " + staged.string()};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(staged, ec);
            return SnipError{SnipError::Storage,
                "short write to " + staged.string()};
        }
    }

    auto removed = remove_if_present(prefix);
    if (removed.is_err()) {
        fs::remove(staged, ec);
        return std::move(removed).error();
    }

    fs::rename(staged, rec.path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staged, ignored);
        return SnipError{SnipError::Storage,
            "cannot publish snippet " + rec.path.string() + ": " + ec.message()};
    }

    return Result<SnippetRecord>::ok(std::move(rec));
}

} // namespace gitsnip
