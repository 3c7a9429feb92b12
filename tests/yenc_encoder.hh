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

#ifndef TESTS_YENC_ENCODER_HH
#define TESTS_YENC_ENCODER_HH

#include <ydecode/stream_utils.hh>

#include <boost/crc.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Fixture builders; the library itself only decodes.
namespace fixture {
    [[nodiscard]] inline uint32_t crc32_of(std::span<uint8_t const> data) {
        boost::crc_32_type checksum;
        checksum.process_bytes(data.data(), data.size());
        return checksum.checksum();
    }

    [[nodiscard]] inline std::string hex(uint32_t const value) {
        std::ostringstream out;
        out << detail::hex32{value};
        return out.str();
    }

    [[nodiscard]] constexpr inline bool is_critical(uint8_t const value) noexcept {
        return value == '\0' || value == '\n' || value == '\r' || value == '=';
    }

    // Encodes `data` into body lines of at most `columns` encoded bytes
    // (an escape pair may overrun by one).
    [[nodiscard]] inline std::vector<std::string> encode_body(
            std::span<uint8_t const> data, size_t const columns = 128U) {
        std::vector<std::string> lines;
        std::string              current;
        for (uint8_t const value : data) {
            auto const shifted = static_cast<uint8_t>(value + 42U);
            if (is_critical(shifted)) {
                current.push_back('=');
                current.push_back(static_cast<char>(static_cast<uint8_t>(shifted + 64U)));
            } else {
                current.push_back(static_cast<char>(shifted));
            }
            if (current.size() >= columns) {
                lines.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) {
            lines.push_back(std::move(current));
        }
        return lines;
    }

    [[nodiscard]] inline std::vector<uint8_t> iota_bytes(size_t const count, uint8_t const first = 0U) {
        std::vector<uint8_t> data(count);
        std::iota(data.begin(), data.end(), first);
        return data;
    }

    // A complete single part article.
    [[nodiscard]] inline std::vector<std::string> single_part(
            std::string const& name, std::span<uint8_t const> data,
            bool const with_crc = true) {
        std::vector<std::string> lines;
        lines.push_back(
                "=ybegin line=128 size=" + std::to_string(data.size()) + " name=" + name);
        auto body = encode_body(data);
        lines.insert(lines.end(), body.begin(), body.end());
        std::string trailer = "=yend size=" + std::to_string(data.size());
        if (with_crc) {
            trailer += " crc32=" + hex(crc32_of(data));
        }
        lines.push_back(trailer);
        return lines;
    }

    // Part `number` (1-based) of `data` split into `total` nearly equal
    // pieces, with pcrc32= and the whole file crc32=.
    [[nodiscard]] inline std::vector<std::string> multipart_piece(
            std::string const& name, std::span<uint8_t const> data, size_t const number,
            size_t const total) {
        size_t const chunk = (data.size() + total - 1) / total;
        size_t const begin = (number - 1) * chunk;
        size_t const end   = std::min(begin + chunk, data.size());
        auto const   piece = data.subspan(begin, end - begin);

        std::vector<std::string> lines;
        lines.push_back(
                "=ybegin part=" + std::to_string(number) + " total=" + std::to_string(total)
                + " line=128 size=" + std::to_string(data.size()) + " name=" + name);
        lines.push_back(
                "=ypart begin=" + std::to_string(begin + 1)
                + " end=" + std::to_string(end));
        auto body = encode_body(piece);
        lines.insert(lines.end(), body.begin(), body.end());
        lines.push_back(
                "=yend size=" + std::to_string(piece.size()) + " part=" + std::to_string(number)
                + " pcrc32=" + hex(crc32_of(piece)) + " crc32=" + hex(crc32_of(data)));
        return lines;
    }

    inline void append(std::vector<std::string>& dest, std::vector<std::string> const& lines) {
        dest.insert(dest.end(), lines.begin(), lines.end());
    }

    [[nodiscard]] inline std::string join(
            std::vector<std::string> const& lines, std::string const& terminator = "\r\n") {
        std::string result;
        for (auto const& line : lines) {
            result += line;
            result += terminator;
        }
        return result;
    }
}    // namespace fixture

#endif    // TESTS_YENC_ENCODER_HH
