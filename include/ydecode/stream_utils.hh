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

#ifndef LIB_STREAM_UTILS_HH
#define LIB_STREAM_UTILS_HH

#include <boost/io/ios_state.hpp>

#include <cstdint>
#include <iomanip>
#include <ios>
#include <ostream>
#include <span>

namespace detail {
    // Prints a CRC-32 as 8 lowercase hex digits, leaving the stream
    // formatting as it was.
    struct hex32 {
        uint32_t value;

        friend std::ostream& operator<<(std::ostream& out, hex32 const crc) {
            boost::io::ios_all_saver const flags(out);
            out << std::hex << std::setw(8) << std::setfill('0') << std::nouppercase
                << std::right << crc.value;
            return out;
        }
    };

    inline void write_bytes(std::ostream& dest, std::span<uint8_t const> data) {
        dest.write(reinterpret_cast<char const*>(data.data()), std::ssize(data));
    }
}    // namespace detail

#endif    // LIB_STREAM_UTILS_HH
