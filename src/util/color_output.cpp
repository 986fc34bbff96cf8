#include "util/color_output.hpp"

#include <algorithm>
#include <cctype>

namespace humanfmt {

namespace {

bool g_color_enabled = true;

const char* kReset = "\x1b[0m";
const char* kBold = "\x1b[1m";

const char* color_code(Color color) {
    switch (color) {
    case Color::kBlack:   return "\x1b[30m";
    case Color::kRed:     return "\x1b[31m";
    case Color::kGreen:   return "\x1b[32m";
    case Color::kYellow:  return "\x1b[33m";
    case Color::kBlue:    return "\x1b[34m";
    case Color::kMagenta: return "\x1b[35m";
    case Color::kCyan:    return "\x1b[36m";
    case Color::kWhite:   return "\x1b[37m";
    case Color::kDefault: break;
    }
    return "";
}

void emit(std::FILE* out, Color color, bool bold, const char* prefix,
          const std::string& msg, const char* terminator) {
    std::string line = prefix;
    line += msg;
    std::fprintf(out, "%s%s", colorize(color, line, bold).c_str(), terminator);
    std::fflush(out);
}

} // namespace

void set_color_enabled(bool enabled) {
    g_color_enabled = enabled;
}

bool color_enabled() {
    return g_color_enabled;
}

bool parse_color(const std::string& name, Color& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    static const struct { const char* name; Color color; } table[] = {
        {"DEFAULT", Color::kDefault}, {"BLACK", Color::kBlack},
        {"RED", Color::kRed},         {"GREEN", Color::kGreen},
        {"YELLOW", Color::kYellow},   {"BLUE", Color::kBlue},
        {"MAGENTA", Color::kMagenta}, {"CYAN", Color::kCyan},
        {"WHITE", Color::kWhite},
    };
    for (const auto& entry : table) {
        if (upper == entry.name) {
            out = entry.color;
            return true;
        }
    }
    return false;
}

std::string colorize(Color color, const std::string& text, bool bold) {
    if (!g_color_enabled) return text;
    std::string s;
    if (bold) s += kBold;
    s += color_code(color);
    s += text;
    s += kReset;
    return s;
}

void cerror(const std::string& msg, std::FILE* out) {
    emit(out, Color::kRed, false, "error: ", msg, "\n");
}

void cfatal_error(const std::string& msg, std::FILE* out) {
    emit(out, Color::kRed, true, "fatal error: ", msg, "\n");
}

void cwarning(const std::string& msg, std::FILE* out) {
    emit(out, Color::kYellow, false, "warning: ", msg, "\n");
}

void ccommand(const std::string& cmd, std::FILE* out) {
    emit(out, Color::kBlue, true, "", cmd, "\n");
}

void cprogress(const std::string& msg, std::FILE* out) {
    emit(out, Color::kGreen, false, "", msg, "\n");
}

void crprogress(const std::string& msg, std::FILE* out) {
    std::fputc('\r', out);
    emit(out, Color::kGreen, false, "", msg, "");
}

} // namespace humanfmt
