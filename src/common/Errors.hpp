#pragma once

#include <stdexcept>
#include <string>

namespace chunkscribe {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Доступ к микрофону запрещен или устройство недоступно
class PermissionError : public Error {
public:
    explicit PermissionError(const std::string& message) : Error(message) {}
};

// Сегмент не удалось декодировать (пустой, поврежденный, неизвестный контейнер)
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message) : Error(message) {}
};

class ConversionError : public Error {
public:
    explicit ConversionError(const std::string& message) : Error(message) {}
};

class EncodeError : public Error {
public:
    explicit EncodeError(const std::string& message) : Error(message) {}
};

// Transport-level failure: resolve, connect, write, read or timeout
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message) : Error(message) {}
};

// The endpoint answered, but not with a usable result
class ServiceError : public Error {
public:
    ServiceError(unsigned int status, const std::string& message)
        : Error("HTTP " + std::to_string(status) + ": " + message)
        , _status(status) {}

    unsigned int GetStatus() const { return _status; }

private:
    unsigned int _status;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

} // namespace chunkscribe
