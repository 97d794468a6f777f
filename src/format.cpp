#include "format.hpp"

#include <bit>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

static constexpr uint64_t KB = 1024;
static constexpr uint64_t MB = KB * 1024;
static constexpr uint64_t GB = MB * 1024;
static constexpr uint64_t TB = GB * 1024;

static std::string scaled(uint64_t value, uint64_t unit, const char* suffix, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision)
       << static_cast<double>(value) / static_cast<double>(unit) << suffix;
    return ss.str();
}

std::string format_rate(uint64_t b) {
    if (b >= GB)
        return scaled(b, GB, " GB/s", 2);
    if (b >= MB)
        return scaled(b, MB, " MB/s", 2);
    if (b >= KB)
        return scaled(b, KB, " KB/s", 2);
    return std::to_string(b) + " B/s";
}

std::string format_size(uint64_t b) {
    if (b >= TB)
        return scaled(b, TB, " TB", 2);
    if (b >= GB)
        return scaled(b, GB, " GB", 2);
    if (b >= MB)
        return scaled(b, MB, " MB", 2);
    if (b >= KB)
        return scaled(b, KB, " KB", 2);
    return std::to_string(b) + " B";
}

// 2^64 as a double; anything at or above it does not fit in uint64_t.
static constexpr double UINT64_LIMIT = 18446744073709551616.0;

static std::string lowercase(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static uint64_t unit_multiplier(const std::string& unit) {
    if (unit.starts_with('g'))
        return GB;
    if (unit.starts_with('m'))
        return MB;
    if (unit.starts_with('k'))
        return KB;
    if (unit.starts_with('t'))
        return TB;
    return 1;
}

uint64_t parse_rate(const std::string& text) {
    const char* begin = text.c_str();
    char*       end   = nullptr;
    double      num   = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(num) || num < 0)
        return 0;
    std::string unit = lowercase(std::string(end));
    while (!unit.empty() && unit.front() == ' ')
        unit.erase(unit.begin());
    const double bytes = num * static_cast<double>(unit_multiplier(unit));
    if (bytes >= UINT64_LIMIT)
        return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(bytes);
}

std::optional<uint64_t> parse_speed_limit(const std::string& raw) {
    std::string input = lowercase(raw);
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front())))
        input.erase(input.begin());
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back())))
        input.pop_back();

    if (input.empty() || input == "0" || input == "unlimited" || input == "none")
        return 0;

    std::string num_str, unit_str;
    bool        in_unit = false;
    for (char c : input) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            if (!in_unit)
                num_str += c;
        } else if (std::isalpha(static_cast<unsigned char>(c))) {
            in_unit = true;
            unit_str += c;
        }
    }

    if (num_str.empty())
        return std::nullopt;
    char*  end = nullptr;
    double num = std::strtod(num_str.c_str(), &end);
    if (end != num_str.c_str() + num_str.size())
        return std::nullopt;

    // No unit means MB/s; an unknown unit letter means bytes.
    const uint64_t multiplier = unit_str.empty() ? MB : unit_multiplier(unit_str);
    const double bytes = num * static_cast<double>(multiplier);
    if (!std::isfinite(bytes) || bytes >= UINT64_LIMIT)
        return std::nullopt;
    return static_cast<uint64_t>(bytes);
}

std::string format_speed_limit(uint64_t b) {
    if (b == 0)
        return "Unlimited";
    if (b >= GB)
        return scaled(b, GB, " GB/s", 1);
    if (b >= MB)
        return scaled(b, MB, " MB/s", 1);
    if (b >= KB)
        return scaled(b, KB, " KB/s", 0);
    return std::to_string(b) + " B/s";
}

std::string truncate_text(const std::string& text, size_t max_len) {
    if (text.size() <= max_len)
        return text;
    if (max_len < 3)
        return text.substr(0, max_len);
    return text.substr(0, max_len - 3) + "...";
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

uint32_t count_set_bits_hex(const std::string& hex) {
    uint32_t n = 0;
    for (char c : hex) {
        const int v = hex_value(c);
        if (v > 0)
            n += static_cast<uint32_t>(std::popcount(static_cast<unsigned>(v)));
    }
    return n;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
                   hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string display_name_for(const std::string& source) {
    if (source.starts_with("magnet:")) {
        const auto query = source.find('?');
        size_t     pos   = query == std::string::npos ? 0 : query + 1;
        while (pos < source.size()) {
            size_t amp = source.find('&', pos);
            if (amp == std::string::npos)
                amp = source.size();
            if (source.compare(pos, 3, "dn=") == 0) {
                std::string name = url_decode(source.substr(pos + 3, amp - pos - 3));
                if (!name.empty())
                    return name;
            }
            pos = amp + 1;
        }
        return "Magnet Download";
    }

    const std::string path = source.substr(0, source.find('?'));
    const auto        slash = path.find_last_of('/');
    std::string       name  = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? "Unknown" : name;
}
