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

#ifndef LIB_YENC_ASSEMBLER_HH
#define LIB_YENC_ASSEMBLER_HH

#include "ydecode/line_source.hh"
#include "ydecode/yenc_part.hh"
#include "ydecode/yenc_session.hh"

#include <boost/crc.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

struct yenc_options {
    // Stop after this many parts have been decoded; 0 means no limit.
    size_t max_parts = 0;
    // Treat a part (or complete multipart set) without a declared CRC-32 as
    // an error instead of skipping the check.
    bool strict_checksums = false;
    // Receives one line per decoding step when set.
    std::ostream* trace = nullptr;
};

// Drives one session over a line source:
//
//     =ybegin -> [=ypart] -> body lines -> =yend -> validate -> next =ybegin
//
// Each validated part is appended to session.parts. The run ends when the
// input runs out while looking for =ybegin, or when max_parts is reached;
// anything else that goes wrong throws yenc_error.
class yenc_assembler {
public:
    yenc_assembler(
            line_source& source_in, yenc_session& session_in,
            yenc_options const& options_in) noexcept
            : source(source_in), session(session_in), options(options_in) {}

    // Returns the number of parts decoded by this call.
    size_t run();

private:
    [[nodiscard]] bool limit_reached() const noexcept;
    // Returns false if the input ended first.
    bool read_begin_header(yenc_part& part);
    void check_duplicate(yenc_part const& part);
    void read_part_header(yenc_part& part);
    void read_body(yenc_part& part, boost::crc_32_type& checksum);
    void validate(yenc_part const& part, uint32_t checksum) const;

    template <typename... Ts>
    void trace(Ts const&... args) const;

    line_source&        source;
    yenc_session&       session;
    yenc_options const& options;
    std::string         line;
};

#endif    // LIB_YENC_ASSEMBLER_HH
