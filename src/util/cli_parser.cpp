#include "util/cli_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace humanfmt {

static bool is_negative_number(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-') return false;
    size_t i = arg[1] == '.' ? 2 : 1;
    return i < arg.size() && std::isdigit(static_cast<unsigned char>(arg[i]));
}

CliParser::CliParser(int argc, char* argv[],
                     const std::vector<std::string>& flags,
                     bool negative_numbers) {
    if (argc > 0) {
        program_ = argv[0];
    }
    std::unordered_set<std::string> flag_set(flags.begin(), flags.end());

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            for (int j = i + 1; j < argc; j++) positional_.push_back(argv[j]);
            break;
        }
        if (negative_numbers && flag_set.count(arg) == 0 && is_negative_number(arg)) {
            positional_.push_back(arg);
        } else if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (flag_set.count(arg) == 0 && i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back(std::string());
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

bool CliParser::has_any(std::initializer_list<const char*> keys) const {
    for (const char* k : keys) {
        if (has(k)) return true;
    }
    return false;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    const std::string& s = it->second.back();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return default_val;
    }
    return static_cast<int>(v);
}

double CliParser::get_double(const std::string& key, double default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    const std::string& s = it->second.back();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return default_val;
    return v;
}

} // namespace humanfmt
