#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace adapters::json {

// Venue payloads mix JSON numbers and numeric strings for the same field.
std::optional<std::int64_t> to_int64(const boost::json::value& value);
std::optional<double> to_double(const boost::json::value& value);

// Parse failures and missing fields throw domain::FeedError(Protocol) naming
// the field and the component passed as `who`.
boost::json::value parse(std::string_view text, std::string_view who);
std::int64_t require_int64(const boost::json::object& obj, std::string_view field, std::string_view who);
double require_double(const boost::json::object& obj, std::string_view field, std::string_view who);
std::string require_string(const boost::json::object& obj, std::string_view field, std::string_view who);
std::int64_t require_int64(const boost::json::value& value, std::string_view field, std::string_view who);
double require_double(const boost::json::value& value, std::string_view field, std::string_view who);

std::optional<std::string> optional_string(const boost::json::object& obj, std::string_view field);

}  // namespace adapters::json
