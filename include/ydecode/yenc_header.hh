/*
 * Copyright (C) 2024 The ydecode authors
 *
 * This program is free software: you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef LIB_YENC_HEADER_HH
#define LIB_YENC_HEADER_HH

#include "ydecode/yenc_part.hh"
#include "ydecode/yenc_session.hh"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace detail {
    using namespace std::string_view_literals;

    constexpr inline std::string_view const begin_marker   = "=ybegin"sv;
    constexpr inline std::string_view const part_marker    = "=ypart"sv;
    constexpr inline std::string_view const trailer_marker = "=yend"sv;
    constexpr inline std::string_view const name_key       = "name="sv;
    constexpr inline std::string_view const whitespace     = " \t\r\n\v\f"sv;

    // Values that do not parse as a whole are replaced by the fallback.
    [[nodiscard]] int64_t  parse_int_or(std::string_view text, int64_t fallback) noexcept;
    // Hexadecimal; up to 64 bits are accepted and the upper half discarded.
    [[nodiscard]] uint32_t parse_crc32_or(std::string_view text, uint32_t fallback) noexcept;

    [[nodiscard]] std::string_view trim(std::string_view text) noexcept;

    // Calls `callback(key, value)` for every whitespace separated token that
    // has a '=', split on the first '='.
    template <typename Callback>
    void for_each_attribute(std::string_view text, Callback&& callback) {
        while (!text.empty()) {
            size_t const start = text.find_first_not_of(whitespace);
            if (start == std::string_view::npos) {
                break;
            }
            text.remove_prefix(start);
            size_t const length = std::min(text.find_first_of(whitespace), text.size());
            std::string_view const token = text.substr(0, length);
            text.remove_prefix(length);

            size_t const equals = token.find('=');
            if (equals == std::string_view::npos) {
                continue;
            }
            std::invoke(callback, token.substr(0, equals), token.substr(equals + 1));
        }
    }
}    // namespace detail

using yenc_attributes = std::map<std::string, std::string, std::less<>>;

[[nodiscard]] inline bool is_begin_header(std::string_view line) noexcept {
    return line.starts_with(detail::begin_marker);
}

[[nodiscard]] inline bool is_part_header(std::string_view line) noexcept {
    return line.starts_with(detail::part_marker);
}

[[nodiscard]] inline bool is_trailer(std::string_view line) noexcept {
    return line.starts_with(detail::trailer_marker);
}

// Splits the text after a marker into its attributes; the parsers below read
// their fields from it. Everything after "name=" is the file name, since
// names may contain spaces and '='; the remaining tokens are key=value pairs.
// Later duplicates win.
[[nodiscard]] yenc_attributes parse_attributes(std::string_view text);

// The parsers below expect a line already recognized by the matching
// is_*() predicate.
void parse_begin_header(std::string_view line, yenc_part& part, yenc_session& session);
void parse_part_header(std::string_view line, yenc_part& part);
// Throws yenc_error(trailer_out_of_order) if part= names another part.
void parse_trailer(std::string_view line, yenc_part& part, yenc_session& session);

#endif    // LIB_YENC_HEADER_HH
