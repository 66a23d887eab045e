#pragma once

#include "notegraph/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace notegraph::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract an array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a bare JSON array of strings, e.g. ["a","b"]. Non-string elements are skipped.
[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &array);

/// Parse a bare JSON array of numbers, e.g. [0.1,-2e-3].
[[nodiscard]] Result<std::vector<double>> json_parse_number_array(const std::string &array);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Shortest round-trippable rendering of a float score.
[[nodiscard]] std::string json_number(double value);

} // namespace notegraph::common
