/**
 * @file log_fields.hpp
 * @brief Structured key/value fields attached to log lines
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <concepts>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <algorithm>

#include <robin_hood.h>

#include "log_types.hpp"

namespace fanlog
{

/**
 * @brief Types that know how to describe themselves as text
 */
template <typename T>
concept Stringer = requires(const T &t) {
    { t.to_string() } -> std::convertible_to<std::string>;
};

/**
 * @brief Typed value of a single structured field
 *
 * Numbers and booleans keep their type so the JSON formatter can emit them
 * unquoted. Everything else is reduced to its textual form when stored.
 */
class field_value
{
  public:
    using storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string>;

    field_value() noexcept : value_(nullptr) {}

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, field_value>)
    field_value(T &&value) : value_(convert(std::forward<T>(value)))
    {
    }

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(value_); }

    template <typename T> const T *get_if() const noexcept { return std::get_if<T>(&value_); }

    const storage &value() const noexcept { return value_; }

    /**
     * @brief Textual form used by the plain formatter
     */
    std::string to_string() const
    {
        return std::visit(
            [](const auto &v) -> std::string
            {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::nullptr_t>) { return "null"; }
                else if constexpr (std::is_same_v<V, bool>) { return v ? "true" : "false"; }
                else if constexpr (std::is_same_v<V, std::string>) { return v; }
                else { return fmt::format("{}", v); }
            },
            value_);
    }

    /**
     * @brief Emit the value as a taocpp/json event
     *
     * NaN and infinities have no JSON representation and are written as strings.
     */
    template <typename Consumer> void to_json(Consumer &c) const
    {
        std::visit(
            [&c, this](const auto &v)
            {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::nullptr_t>) { c.null(); }
                else if constexpr (std::is_same_v<V, bool>) { c.boolean(v); }
                else if constexpr (std::is_same_v<V, int64_t>) { c.number(static_cast<std::int64_t>(v)); }
                else if constexpr (std::is_same_v<V, uint64_t>) { c.number(static_cast<std::uint64_t>(v)); }
                else if constexpr (std::is_same_v<V, double>)
                {
                    if (std::isfinite(v)) { c.number(v); }
                    else { c.string(to_string()); }
                }
                else { c.string(v); }
            },
            value_);
    }

    bool operator==(const field_value &other) const = default;

  private:
    template <typename T> static storage convert(T &&value)
    {
        using U = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<U, std::nullptr_t>) { return nullptr; }
        else if constexpr (std::is_same_v<U, bool>) { return value; }
        else if constexpr (std::is_same_v<U, char>) { return std::string(1, value); }
        else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) { return static_cast<int64_t>(value); }
        else if constexpr (std::is_integral_v<U>) { return static_cast<uint64_t>(value); }
        else if constexpr (std::is_floating_point_v<U>) { return static_cast<double>(value); }
        else if constexpr (std::is_array_v<U>) { return std::string(value); }
        else if constexpr (std::is_same_v<std::decay_t<U>, const char *> || std::is_same_v<std::decay_t<U>, char *>)
        {
            if (value == nullptr) return nullptr;
            return std::string(value);
        }
        else if constexpr (Stringer<U>) { return std::string(value.to_string()); }
        else if constexpr (std::is_same_v<U, std::string>) { return std::string(std::forward<T>(value)); }
        else if constexpr (std::is_convertible_v<const U &, std::string_view>)
        {
            return std::string(std::string_view(value));
        }
        else
        {
            static_assert(Loggable<U>, "field values must be formattable with fmt or expose to_string()");
            return fmt::format("{}", value);
        }
    }

    storage value_;
};

/**
 * @brief Unordered set of structured fields
 */
using log_fields = robin_hood::unordered_map<std::string, field_value>;

/**
 * @brief Union of two field sets where @p additional wins on key collision
 *
 * If either side is empty the other side is returned unchanged.
 */
inline log_fields merge_fields(log_fields base, const log_fields &additional)
{
    if (additional.empty()) return base;
    if (base.empty()) return additional;

    for (const auto &[key, value] : additional) { base.insert_or_assign(key, value); }
    return base;
}

/**
 * @brief Render fields as sorted "key=value" pairs separated by single spaces
 *
 * A value containing whitespace is wrapped in double quotes.
 */
inline std::string render_fields(const log_fields &fields)
{
    std::vector<const log_fields::value_type *> sorted;
    sorted.reserve(fields.size());
    for (const auto &kv : fields) { sorted.push_back(&kv); }
    std::sort(sorted.begin(), sorted.end(), [](const auto *a, const auto *b) { return a->first < b->first; });

    std::string out;
    for (const auto *kv : sorted)
    {
        if (!out.empty()) out.push_back(' ');

        auto text = kv->second.to_string();
        out.append(kv->first);
        out.push_back('=');
        if (text.find_first_of(" \t\n\r\v\f") != std::string::npos)
        {
            out.push_back('"');
            out.append(text);
            out.push_back('"');
        }
        else { out.append(text); }
    }
    return out;
}

/**
 * @brief Result of splitting a plain formatted line back into fields and message
 */
struct parsed_line
{
    std::map<std::string, std::string> fields;
    std::string message;
};

/**
 * @brief Parse the output of the plain formatter
 *
 * Leading "key=value" tokens become fields (quoted values keep their inner
 * spaces). Parsing stops at the first token that is not a field; the rest of
 * the line is the message. A trailing newline is dropped.
 */
inline parsed_line parse_plain_text(std::string_view line)
{
    parsed_line result;

    if (!line.empty() && line.back() == '\n') line.remove_suffix(1);

    auto is_key_char = [](char c)
    { return c != ' ' && c != '=' && c != '"' && c != '\t' && c != '\n' && c != '\r'; };

    size_t pos = 0;
    while (pos < line.size())
    {
        size_t key_end = pos;
        while (key_end < line.size() && is_key_char(line[key_end])) ++key_end;
        if (key_end == pos || key_end >= line.size() || line[key_end] != '=') break;

        size_t value_begin = key_end + 1;
        size_t value_end;
        size_t next;
        if (value_begin < line.size() && line[value_begin] == '"')
        {
            auto close = line.find('"', value_begin + 1);
            if (close == std::string_view::npos) break;
            value_end = close;
            next = close + 1;
            ++value_begin;
        }
        else
        {
            value_end = line.find(' ', value_begin);
            if (value_end == std::string_view::npos) value_end = line.size();
            next = value_end;
        }

        // a field is always followed by a separator, the last token is the message
        if (next >= line.size() || line[next] != ' ') break;

        result.fields.insert_or_assign(std::string(line.substr(pos, key_end - pos)),
                                       std::string(line.substr(value_begin, value_end - value_begin)));
        pos = next + 1;
    }

    result.message = std::string(line.substr(pos));
    return result;
}

} // namespace fanlog
