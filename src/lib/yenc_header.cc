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

#include "ydecode/yenc_header.hh"

#include "ydecode/yenc_error.hh"

#include <charconv>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace detail {
    int64_t parse_int_or(std::string_view const text, int64_t const fallback) noexcept {
        int64_t value = 0;
        auto const* const last = text.data() + text.size();
        auto [ptr, ec]         = std::from_chars(text.data(), last, value);
        if (ec != std::errc{} || ptr != last) {
            return fallback;
        }
        return value;
    }

    uint32_t parse_crc32_or(std::string_view const text, uint32_t const fallback) noexcept {
        // Some posters emit more than 8 hex digits.
        uint64_t value = 0;
        auto const* const last = text.data() + text.size();
        auto [ptr, ec]         = std::from_chars(text.data(), last, value, 16);
        if (ec != std::errc{} || ptr != last) {
            return fallback;
        }
        return static_cast<uint32_t>(value);
    }

    std::string_view trim(std::string_view text) noexcept {
        size_t const first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        size_t const last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    // Splits `text` at the name attribute, returning the text before it.
    static std::string_view split_name(std::string_view const text, std::string_view& name) {
        size_t const position = text.find(name_key);
        if (position == std::string_view::npos) {
            name = {};
            return text;
        }
        name = trim(text.substr(position + name_key.size()));
        return text.substr(0, position);
    }
}    // namespace detail

yenc_attributes parse_attributes(std::string_view const text) {
    yenc_attributes  result;
    std::string_view name;
    auto const       rest = detail::split_name(text, name);
    detail::for_each_attribute(rest, [&](std::string_view key, std::string_view value) {
        result.insert_or_assign(std::string(key), std::string(value));
    });
    if (rest.size() != text.size()) {
        result.insert_or_assign("name", std::string(name));
    }
    return result;
}

namespace detail {
    static int64_t int_attribute(yenc_attributes const& attributes, std::string_view key) {
        auto const found = attributes.find(key);
        return found == attributes.end() ? 0 : parse_int_or(found->second, 0);
    }
}    // namespace detail

void parse_begin_header(
        std::string_view const line, yenc_part& part, yenc_session& session) {
    auto const attributes = parse_attributes(line.substr(detail::begin_marker.size()));
    if (auto const found = attributes.find("name"); found != attributes.end()) {
        part.name = found->second;
    }
    part.header_size = detail::int_attribute(attributes, "size");
    part.columns     = detail::int_attribute(attributes, "line");
    if (auto const found = attributes.find("part"); found != attributes.end()) {
        part.number       = detail::parse_int_or(found->second, 0);
        session.multipart = true;
    }
    // Later parts may leave out total=.
    if (auto const found = attributes.find("total"); found != attributes.end()) {
        session.total_parts = detail::parse_int_or(found->second, 0);
    }
}

void parse_part_header(std::string_view const line, yenc_part& part) {
    auto const attributes = parse_attributes(line.substr(detail::part_marker.size()));
    part.begin = detail::int_attribute(attributes, "begin");
    part.end   = detail::int_attribute(attributes, "end");
}

void parse_trailer(std::string_view const line, yenc_part& part, yenc_session& session) {
    auto const attributes = parse_attributes(line.substr(detail::trailer_marker.size()));
    if (auto const found = attributes.find("part"); found != attributes.end()) {
        auto const number = detail::parse_int_or(found->second, 0);
        if (number != part.number) {
            std::ostringstream message;
            message << "=yend for part " << number << " while decoding part " << part.number;
            throw yenc_error(yenc_errc::trailer_out_of_order, message.str());
        }
    }
    part.size = detail::int_attribute(attributes, "size");
    if (auto const found = attributes.find("pcrc32"); found != attributes.end()) {
        part.crc32 = detail::parse_crc32_or(found->second, 0);
    }
    if (auto const found = attributes.find("crc32"); found != attributes.end()) {
        session.file_crc32 = detail::parse_crc32_or(found->second, 0);
        // Single part posts often carry only crc32=.
        if (!session.multipart && part.crc32 == 0) {
            part.crc32 = session.file_crc32;
        }
    }
}
