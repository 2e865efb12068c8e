#ifndef ATELIER_ERRORS_HPP
#define ATELIER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace atelier {

enum class ErrorKind {
    NotFound,
    InvalidInput,
    Unauthorized,
    UpstreamUnavailable,
    Internal
};

const char* toString(ErrorKind kind);

class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}

#endif // ATELIER_ERRORS_HPP
