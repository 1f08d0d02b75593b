#include "domain/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace domain {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::TransientNetwork:
        return "transient_network";
    case ErrorKind::RateLimited:
        return "rate_limited";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::Authentication:
        return "authentication";
    case ErrorKind::StorageWrite:
        return "storage_write";
    case ErrorKind::BackfillFetch:
        return "backfill_fetch";
    case ErrorKind::Configuration:
        return "configuration";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::TransientNetwork:
    case ErrorKind::RateLimited:
    case ErrorKind::Protocol:
    case ErrorKind::StorageWrite:
        return true;
    case ErrorKind::Authentication:
    case ErrorKind::BackfillFetch:
    case ErrorKind::Configuration:
        return false;
    }
    return false;
}

ErrorKind classify_http_status(int status) noexcept {
    if (status == 429 || status == 418) {
        return ErrorKind::RateLimited;
    }
    if (status == 401 || status == 403) {
        return ErrorKind::Authentication;
    }
    if (status >= 500) {
        return ErrorKind::TransientNetwork;
    }
    return ErrorKind::Protocol;
}

bool looks_like_throttle(std::string_view message) {
    std::string lower(message.size(), '\0');
    std::transform(message.begin(), message.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    static constexpr std::array<std::string_view, 4> kMarkers{
        "rate limit", "too many requests", "429", "throttle"};
    return std::any_of(kMarkers.begin(), kMarkers.end(), [&](std::string_view marker) {
        return lower.find(marker) != std::string::npos;
    });
}

}  // namespace domain
