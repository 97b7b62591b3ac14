#include "cli/cli_parser.hpp"

#include <algorithm>

namespace tissueseg {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0) {
            positional_.push_back(a);
            continue;
        }
        std::string key = a.substr(2);
        std::string val = "true";
        // --key=value
        const auto eq = key.find('=');
        if (eq != std::string::npos) {
            val = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else if (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                val = next;
                ++i;
            }
        }
        kv_[key] = val;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

std::vector<std::string> CliParser::unknown_keys(const std::vector<std::string>& allowed) const {
    std::vector<std::string> out;
    for (const auto& [k, v] : kv_) {
        if (std::find(allowed.begin(), allowed.end(), k) == allowed.end()) out.push_back(k);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace tissueseg
