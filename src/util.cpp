#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace msgraph_sync {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    if (pathStart == std::string::npos) {
        parts.authority = url.substr(hostStart);
        parts.target    = "/";
    } else {
        parts.authority = url.substr(hostStart, pathStart - hostStart);
        parts.target    = url.substr(pathStart);
        // Fragments never go on the wire.
        auto hash = parts.target.find('#');
        if (hash != std::string::npos) {
            parts.target.erase(hash);
        }
        if (parts.target.empty() || parts.target.front() != '/') {
            parts.target.insert(0, "/");
        }
    }

    // --- host / port ---
    auto colon = parts.authority.find(':');
    if (colon == std::string::npos) {
        parts.host = parts.authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = parts.authority.substr(0, colon);
        parts.port = parts.authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty() ||
        !std::all_of(parts.port.begin(), parts.port.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument("Invalid URL (bad port): " + url);
    }
    return parts;
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string encodeQuery(const QueryParams& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out.push_back('&');
        out += urlEncode(key);
        out.push_back('=');
        out += urlEncode(value);
    }
    return out;
}

std::string buildUrl(const std::string& base,
                     const std::string& version,
                     const std::string& path,
                     const QueryParams& params) {
    const auto parts = parseUrl(base);

    std::string url = parts.scheme + "://" + parts.authority + "/" + version;
    if (!path.empty()) {
        if (path.front() != '/') url.push_back('/');
        url += path;
    }

    const auto query = encodeQuery(params);
    if (!query.empty()) {
        url.push_back('?');
        url += query;
    }
    return url;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs,
                                           int64_t maxMs, int64_t jitterMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.  The shift is capped
    // so large attempt numbers cannot overflow.
    const int shift = std::clamp(attempt, 0, 30);
    int64_t backoff = baseMs * (int64_t{1} << shift);
    backoff = std::min(backoff, maxMs);

    // Jitter: uniform random in [0, jitterMs] ms.
    if (jitterMs > 0) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int64_t> jitter(0, jitterMs);
        backoff += jitter(rng);
    }

    return std::chrono::milliseconds(backoff);
}

} // namespace msgraph_sync
