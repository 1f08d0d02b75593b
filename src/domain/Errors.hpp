#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace domain {

enum class ErrorKind {
    TransientNetwork,
    RateLimited,
    Protocol,
    Authentication,
    StorageWrite,
    BackfillFetch,
    Configuration,
};

std::string_view to_string(ErrorKind kind) noexcept;

// Retrying the same operation later may succeed.
bool is_retryable(ErrorKind kind) noexcept;

// 429/418 rate limited, 401/403 authentication, 5xx transient, other >= 400 protocol.
ErrorKind classify_http_status(int status) noexcept;

// Message text mentioning a throttle condition ("rate limit", "429", ...).
bool looks_like_throttle(std::string_view message);

class FeedError : public std::runtime_error {
public:
    FeedError(ErrorKind kind, const std::string& message, std::optional<int> httpStatus = std::nullopt)
        : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::optional<int> http_status() const noexcept { return httpStatus_; }
    bool retryable() const noexcept { return is_retryable(kind_); }

private:
    ErrorKind kind_;
    std::optional<int> httpStatus_;
};

}  // namespace domain
