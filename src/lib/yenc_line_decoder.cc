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

#include "ydecode/yenc_line_decoder.hh"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

size_t yenc_line_decoder::decode(std::string_view line, std::vector<uint8_t>& dest) {
    size_t const start = dest.size();
    dest.reserve(start + line.size());
    for (char const curr : line) {
        auto const value = static_cast<uint8_t>(curr);
        if (escape_pending) {
            escape_pending = false;
            dest.push_back(static_cast<uint8_t>(
                    static_cast<uint8_t>(value - detail::yenc_offset)
                    - detail::escape_offset));
        } else if (curr == detail::escape_char) {
            escape_pending = true;
        } else {
            dest.push_back(static_cast<uint8_t>(value - detail::yenc_offset));
        }
    }
    return dest.size() - start;
}
