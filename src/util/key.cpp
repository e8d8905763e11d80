#include <gitsnip/key.hpp>
#include <gitsnip/sha256.hpp>
#include <gitsnip/log.hpp>

namespace gitsnip {

std::string short_hash(const std::string& input) {
    return SHA256::short_hex(input, 8);
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string last = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (last.empty() || last == "." || last == "..") return "unknown";
    return last;
}

std::string derive_key(const std::string& repo_url,
                       const std::string& selector_kind,
                       const std::string& selector_value,
                       const std::string& path) {
    std::string url_hash = short_hash(repo_url);
    std::string option_hash = short_hash(selector_kind + "-" + selector_value);
    std::string path_hash = short_hash(path);

    gitsnip::log::debug("url hash: %s (%s)", url_hash.c_str(), repo_url.c_str());
    gitsnip::log::debug("selector hash: %s (%s-%s)", option_hash.c_str(),
                        selector_kind.c_str(), selector_value.c_str());
    gitsnip::log::debug("path hash: %s (%s)", path_hash.c_str(), path.c_str());

    return url_hash + "-" + option_hash + "-" + path_hash + "-" + base_name(path);
}

} // namespace gitsnip
