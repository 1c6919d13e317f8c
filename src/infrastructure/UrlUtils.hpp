// UrlUtils Header
#pragma once
#include <optional>
#include <string>

namespace runrelay::infrastructure {

struct UrlParts {
    std::string scheme; ///< Lowercase: ws, wss, http or https.
    std::string host;
    std::string port;   ///< Explicit port, or the scheme default.
    std::string target; ///< Path plus query, at least "/".

    bool isSecure() const { return scheme == "wss" || scheme == "https"; }
    std::string origin() const { return scheme + "://" + host + ":" + port; }
};

class UrlUtils {
public:
    static std::optional<UrlParts> Parse(const std::string& url);
    static std::string PercentEncode(const std::string& value);
    static std::string AppendQueryParameter(const std::string& url, const std::string& key, const std::string& value);
};

} // namespace runrelay::infrastructure
