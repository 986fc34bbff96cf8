#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace humanfmt {

// Simple command-line argument parser for -key value style arguments.
//
// An option takes the following argument as its value unless that argument
// starts with '-' or the option is listed in flags; a valueless option
// records an empty value. "--key=value" is also accepted. Everything after
// "--" is positional.
//
// With negative_numbers set, arguments such as "-5" or "-.5" are positional
// values rather than options, unless listed in flags.
class CliParser {
public:
    CliParser(int argc, char* argv[],
              const std::vector<std::string>& flags = {},
              bool negative_numbers = false);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Check if any of the given spellings is present ("-s", "--space").
    bool has_any(std::initializer_list<const char*> keys) const;

    // Get string value for a key. Returns default_val if not found.
    // Repeated options: the last occurrence wins.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for a repeated option, in order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Get integer value for a key. Returns default_val if not found or not
    // entirely an integer ("10.5" and "3x" are invalid).
    int get_int(const std::string& key, int default_val = 0) const;

    // Get double value for a key. Returns default_val if not found or not
    // entirely a number.
    double get_double(const std::string& key, double default_val = 0.0) const;

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace humanfmt
