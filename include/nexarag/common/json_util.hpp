#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace nexarag::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX sequences (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field accessors return an empty string when the field is absent or has another type.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json,
                                                const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Parses `[1, -0.5, 2e-3]`. Returns nullopt when any element is not a number.
[[nodiscard]] std::optional<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// Splits the top-level elements of a JSON array that open with `open_ch`.
[[nodiscard]] std::vector<std::string> json_split_top_level(const std::string &array_json,
                                                            char open_ch, char close_ch);
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Serializes floats as a JSON array.
[[nodiscard]] std::string json_float_array(const std::vector<float> &values);

} // namespace nexarag::common
