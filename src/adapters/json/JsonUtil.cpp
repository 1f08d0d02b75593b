#include "adapters/json/JsonUtil.hpp"

#include <cmath>
#include <exception>

#include "domain/Errors.hpp"

namespace adapters::json {
namespace {

[[noreturn]] void fail(std::string_view who, const std::string& message) {
    throw domain::FeedError(domain::ErrorKind::Protocol, std::string(who) + ": " + message);
}

}  // namespace

std::optional<std::int64_t> to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const auto parsed = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const auto parsed = std::stod(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

boost::json::value parse(std::string_view text, std::string_view who) {
    boost::json::error_code ec;
    auto value = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        fail(who, "invalid JSON payload (" + ec.message() + ")");
    }
    return value;
}

std::int64_t require_int64(const boost::json::value& value, std::string_view field, std::string_view who) {
    const auto parsed = to_int64(value);
    if (!parsed) {
        fail(who, "field '" + std::string(field) + "' is not an integer");
    }
    return *parsed;
}

double require_double(const boost::json::value& value, std::string_view field, std::string_view who) {
    const auto parsed = to_double(value);
    if (!parsed || !std::isfinite(*parsed)) {
        fail(who, "field '" + std::string(field) + "' is not a number");
    }
    return *parsed;
}

std::int64_t require_int64(const boost::json::object& obj, std::string_view field, std::string_view who) {
    const auto* value = obj.if_contains(boost::json::string_view(field.data(), field.size()));
    if (value == nullptr) {
        fail(who, "missing field '" + std::string(field) + "'");
    }
    return require_int64(*value, field, who);
}

double require_double(const boost::json::object& obj, std::string_view field, std::string_view who) {
    const auto* value = obj.if_contains(boost::json::string_view(field.data(), field.size()));
    if (value == nullptr) {
        fail(who, "missing field '" + std::string(field) + "'");
    }
    return require_double(*value, field, who);
}

std::string require_string(const boost::json::object& obj, std::string_view field, std::string_view who) {
    auto value = optional_string(obj, field);
    if (!value) {
        fail(who, "missing string field '" + std::string(field) + "'");
    }
    return *value;
}

std::optional<std::string> optional_string(const boost::json::object& obj, std::string_view field) {
    const auto* value = obj.if_contains(boost::json::string_view(field.data(), field.size()));
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    const auto& str = value->as_string();
    return std::string(str.data(), str.size());
}

}  // namespace adapters::json
