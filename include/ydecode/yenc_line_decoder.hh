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

#ifndef LIB_YENC_LINE_DECODER_HH
#define LIB_YENC_LINE_DECODER_HH

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace detail {
    constexpr inline uint8_t const yenc_offset   = 42U;
    constexpr inline uint8_t const escape_offset = 64U;
    constexpr inline char const    escape_char   = '=';
}    // namespace detail

// Undoes the yEnc byte shift and escaping of one line at a time. An escape
// character at the end of a line applies to the first byte of the next line,
// so the pending escape is kept between calls until reset().
class yenc_line_decoder {
public:
    // Appends the decoded bytes of `line` to `dest`; returns how many bytes
    // were appended.
    size_t decode(std::string_view line, std::vector<uint8_t>& dest);

    void reset() noexcept {
        escape_pending = false;
    }

    [[nodiscard]] bool pending() const noexcept {
        return escape_pending;
    }

private:
    bool escape_pending = false;
};

#endif    // LIB_YENC_LINE_DECODER_HH
