#pragma once

#include <string>

#include <json/json.h>

namespace humanfmt {

// User configuration stored as JSON under $XDG_CONFIG_HOME (or ~/.config).
//
// load() locates the file. A missing file is an error unless
// allow_missing is set, in which case the parent directories (mode 0700)
// and an empty file are created. An empty file reads as an empty object.
class ConfigFile {
public:
    ConfigFile() = default;

    // relative_path: e.g. "humanfmt/config.json".
    // Returns false and sets error_msg if the file cannot be found, created,
    // read or parsed.
    bool load(const std::string& relative_path, bool allow_missing,
              std::string& error_msg);

    // Load from an explicit path (no XDG resolution).
    bool load_file(const std::string& path, bool allow_missing,
                   std::string& error_msg);

    // Write the current values back, indented by four spaces.
    bool rewrite(std::string& error_msg) const;

    const std::string& path() const { return path_; }
    bool has(const std::string& key) const { return root_.isMember(key); }

    // Typed lookups; a missing key or a value of the wrong type yields
    // default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    int get_int(const std::string& key, int default_val = 0) const;
    double get_double(const std::string& key, double default_val = 0.0) const;

    void set(const std::string& key, const Json::Value& value) { root_[key] = value; }

    const Json::Value& root() const { return root_; }

private:
    std::string path_;
    Json::Value root_{Json::objectValue};
};

// Resolve a path relative to $XDG_CONFIG_HOME, falling back to ~/.config.
// Returns an empty string if neither variable is usable.
std::string config_file_path(const std::string& relative_path);

} // namespace humanfmt
