#include "util/config_file.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

namespace humanfmt {

std::string config_file_path(const std::string& relative_path) {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (std::filesystem::path(xdg) / relative_path).string();
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return (std::filesystem::path(home) / ".config" / relative_path).string();
}

bool ConfigFile::load(const std::string& relative_path, bool allow_missing,
                      std::string& error_msg) {
    std::string path = config_file_path(relative_path);
    if (path.empty()) {
        error_msg = "cannot locate config file: neither XDG_CONFIG_HOME nor HOME is set";
        return false;
    }
    return load_file(path, allow_missing, error_msg);
}

bool ConfigFile::load_file(const std::string& path, bool allow_missing,
                           std::string& error_msg) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        if (!allow_missing) {
            error_msg = "config file '" + path + "' not found";
            return false;
        }
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                error_msg = "cannot create " + parent.string() + ": " + ec.message();
                return false;
            }
            fs::permissions(parent, fs::perms::owner_all,
                            fs::perm_options::replace, ec);
        }
        std::ofstream touch(path);
        if (!touch) {
            error_msg = "cannot create config file '" + path + "'";
            return false;
        }
    }

    std::ifstream in(path);
    if (!in) {
        error_msg = "cannot open config file '" + path + "'";
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string content = ss.str();

    path_ = path;
    root_ = Json::Value(Json::objectValue);
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return true;
    }

    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    std::string parse_errors;
    Json::Value parsed;
    if (!reader->parse(content.data(), content.data() + content.size(),
                       &parsed, &parse_errors)) {
        error_msg = "failed to parse config file '" + path + "': " + parse_errors;
        return false;
    }
    if (!parsed.isObject()) {
        error_msg = "config file '" + path + "' must contain a JSON object";
        return false;
    }
    root_ = std::move(parsed);
    return true;
}

bool ConfigFile::rewrite(std::string& error_msg) const {
    if (path_.empty()) {
        error_msg = "config file has not been loaded";
        return false;
    }
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        error_msg = "cannot write config file '" + path_ + "'";
        return false;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "    ";
    out << Json::writeString(writer, root_) << '\n';
    if (!out) {
        error_msg = "error writing config file '" + path_ + "'";
        return false;
    }
    return true;
}

std::string ConfigFile::get_string(const std::string& key,
                                   const std::string& default_val) const {
    const Json::Value& v = root_[key];
    return v.isString() ? v.asString() : default_val;
}

bool ConfigFile::get_bool(const std::string& key, bool default_val) const {
    const Json::Value& v = root_[key];
    return v.isBool() ? v.asBool() : default_val;
}

int ConfigFile::get_int(const std::string& key, int default_val) const {
    const Json::Value& v = root_[key];
    return v.isInt() ? v.asInt() : default_val;
}

double ConfigFile::get_double(const std::string& key, double default_val) const {
    const Json::Value& v = root_[key];
    return v.isNumeric() ? v.asDouble() : default_val;
}

} // namespace humanfmt
