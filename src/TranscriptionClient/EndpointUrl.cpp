#include "EndpointUrl.hpp"

#include "../common/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace chunkscribe {

namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool IsPort(const std::string& value) {
    if (value.empty() || value.size() > 5) {
        return false;
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    const int port = std::stoi(value);
    return port > 0 && port <= 65535;
}

} // namespace

EndpointUrl EndpointUrl::Parse(const std::string& url) {
    const std::string httpScheme = "http://";

    if (StartsWith(url, "https://")) {
        throw ConfigError("https endpoints are not supported: " + url);
    }
    if (!StartsWith(url, httpScheme)) {
        throw ConfigError("Endpoint must start with http://: " + url);
    }

    const std::string rest = url.substr(httpScheme.size());
    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);

    EndpointUrl endpoint;
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
    }

    std::string portPart;
    if (!authority.empty() && authority.front() == '[') {
        // [::1]:8000
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigError("Unterminated IPv6 address in endpoint: " + url);
        }
        endpoint.host = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw ConfigError("Unexpected characters after IPv6 address: " + url);
            }
            portPart = tail.substr(1);
        }
    } else {
        const size_t colon = authority.find(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portPart = authority.substr(colon + 1);
        }
    }

    if (endpoint.host.empty()) {
        throw ConfigError("Endpoint has no host: " + url);
    }
    if (!portPart.empty() || authority.back() == ':') {
        if (!IsPort(portPart)) {
            throw ConfigError("Invalid port in endpoint: " + url);
        }
        endpoint.port = portPart;
    }

    return endpoint;
}

std::string EndpointUrl::ToString() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    return "http://" + (ipv6 ? "[" + host + "]" : host) + ":" + port + target;
}

} // namespace chunkscribe
