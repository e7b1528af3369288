#include "osync/version/remote_version.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace osync::version {
namespace {

std::vector<std::string> split_components(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == '.' || c == '-') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

bool parse_number(const std::string& text, std::uint32_t& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    std::uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    out = value;
    return true;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::string RemoteVersion::to_string() const {
    std::ostringstream oss;
    oss << major << '.' << minor << '.' << patch;
    return oss.str();
}

Result<RemoteVersion> RemoteVersion::parse(const std::string& text) {
    const auto parts = split_components(trim(text));
    if (parts.size() < 2) {
        return Err<RemoteVersion>(ErrorKind::Parse, "Unable to parse version: '" + text + "'");
    }

    RemoteVersion parsed;
    if (!parse_number(parts[0], parsed.major) || !parse_number(parts[1], parsed.minor)) {
        return Err<RemoteVersion>(ErrorKind::Parse, "Unable to parse version: '" + text + "'");
    }
    if (parts.size() > 2 && !parse_number(parts[2], parsed.patch)) {
        parsed.patch = 0;
    }
    return Ok(parsed);
}

} // namespace osync::version
