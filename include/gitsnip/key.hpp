#pragma once

#include <string>

namespace gitsnip {

// Cache keys are built from 8-character SHA-256 prefixes:
//
//   <H(url)>-<H(kind "-" value)>-<H(path)>-<base name of path>
//
// The key covers what was asked for, never the commit it resolved to, so
// it stays stable while the upstream ref moves.

// Truncated hex digest used for every key component
std::string short_hash(const std::string& input);

// Final component of a slash-separated path, or "unknown" if there is none
std::string base_name(const std::string& path);

std::string derive_key(const std::string& repo_url,
                       const std::string& selector_kind,
                       const std::string& selector_value,
                       const std::string& path);

} // namespace gitsnip
