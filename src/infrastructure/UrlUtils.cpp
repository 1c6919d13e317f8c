#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace runrelay::infrastructure {

std::optional<UrlParts> UrlUtils::Parse(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    std::string defaultPort;
    if (parts.scheme == "ws" || parts.scheme == "http") {
        defaultPort = "80";
    } else if (parts.scheme == "wss" || parts.scheme == "https") {
        defaultPort = "443";
    } else {
        return std::nullopt;
    }

    std::string rest = url.substr(schemeEnd + 3);
    auto targetStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, targetStart);
    parts.target = targetStart == std::string::npos ? "/" : rest.substr(targetStart);
    if (parts.target[0] == '?') {
        parts.target = "/" + parts.target;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    } else {
        parts.host = authority;
        parts.port = defaultPort;
    }

    if (parts.host.empty() || parts.port.empty() ||
        !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return parts;
}

std::string UrlUtils::PercentEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string UrlUtils::AppendQueryParameter(const std::string& url, const std::string& key, const std::string& value) {
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + PercentEncode(key) + "=" + PercentEncode(value);
}

} // namespace runrelay::infrastructure
