#pragma once

#include <string>

namespace chunkscribe {

// http://host[:port]/target
struct EndpointUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";

    // Throws ConfigError; https is not supported
    static EndpointUrl Parse(const std::string& url);

    std::string ToString() const;
};

} // namespace chunkscribe
