#pragma once

#include <stdexcept>
#include <string>

namespace neo {

class NetworkException : public std::runtime_error {
public:
    explicit NetworkException(const std::string& message)
        : std::runtime_error(message) {}
};

class TimeoutException : public NetworkException {
public:
    explicit TimeoutException(const std::string& message)
        : NetworkException(message) {}
};

class ConnectionException : public NetworkException {
public:
    explicit ConnectionException(const std::string& message)
        : NetworkException(message) {}
};

// The server answered, but not with a 2xx status
class HttpStatusException : public NetworkException {
public:
    HttpStatusException(long status_code, const std::string& message)
        : NetworkException("HTTP " + std::to_string(status_code) + ": " + message), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

} // namespace neo
