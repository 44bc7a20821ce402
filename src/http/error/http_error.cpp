#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::error {
    NetworkError::NetworkError(std::string u, const std::string &msg) : std::runtime_error(msg), url_(std::move(u)) {}
};  // namespace http::error
