#pragma once

#include <cstdio>
#include <string>

namespace humanfmt {

enum class Color {
    kDefault, kBlack, kRed, kGreen, kYellow, kBlue, kMagenta, kCyan, kWhite
};

// Global switch; disabled output carries no escape sequences.
void set_color_enabled(bool enabled);
bool color_enabled();

// Case-insensitive color name ("red", "Default", ...).
// Returns false for unknown names and leaves out untouched.
bool parse_color(const std::string& name, Color& out);

// Wrap text in the escape codes for color (and bold), reset at the end.
std::string colorize(Color color, const std::string& text, bool bold = false);

// Diagnostics, newline-terminated, to stderr unless told otherwise.
void cerror(const std::string& msg, std::FILE* out = stderr);        // red "error: "
void cfatal_error(const std::string& msg, std::FILE* out = stderr);  // bold red "fatal error: "
void cwarning(const std::string& msg, std::FILE* out = stderr);      // yellow "warning: "
void ccommand(const std::string& cmd, std::FILE* out = stderr);      // bold blue
void cprogress(const std::string& msg, std::FILE* out = stderr);     // green

// Green progress text preceded by a carriage return, no newline.
void crprogress(const std::string& msg, std::FILE* out = stderr);

} // namespace humanfmt
