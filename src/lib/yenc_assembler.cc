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

#include "ydecode/yenc_assembler.hh"

#include "ydecode/stream_utils.hh"
#include "ydecode/yenc_error.hh"
#include "ydecode/yenc_header.hh"

#include <boost/crc.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace {
    // Bogus total= values should not turn into huge allocations.
    constexpr size_t const max_reserved_parts = 4096U;
}    // namespace

template <typename... Ts>
void yenc_assembler::trace(Ts const&... args) const {
    if (options.trace != nullptr) {
        ((*options.trace << "yenc: ") << ... << args) << '\n';
    }
}

bool yenc_assembler::limit_reached() const noexcept {
    return options.max_parts != 0 && session.parts.size() >= options.max_parts;
}

size_t yenc_assembler::run() {
    size_t decoded = 0;
    while (!limit_reached()) {
        yenc_part part;
        if (!read_begin_header(part)) {
            trace("input exhausted after ", session.parts.size(), " parts");
            return decoded;
        }
        trace("=ybegin name='", part.name, "' part=", part.number,
              " size=", part.header_size, " total=", session.total_parts);

        if (part.name.empty()) {
            std::ostringstream message;
            message << "=ybegin of part " << part.number << " has no name=";
            throw yenc_error(yenc_errc::missing_filename, message.str());
        }
        check_duplicate(part);

        if (session.multipart) {
            read_part_header(part);
            trace("=ypart begin=", part.begin, " end=", part.end);
        }

        boost::crc_32_type checksum;
        read_body(part, checksum);
        validate(part, checksum.checksum());
        trace("part ", part.number, " of '", part.name, "' is valid, ", part.body.size(),
              " bytes");

        session.parts.push_back(std::move(part));
        decoded++;
    }
    trace("stopping after ", session.parts.size(), " parts");
    return decoded;
}

bool yenc_assembler::read_begin_header(yenc_part& part) {
    while (true) {
        switch (source.next(line)) {
        case line_status::line:
            if (is_begin_header(line)) {
                parse_begin_header(line, part, session);
                if (session.total_parts > 0) {
                    auto const count = std::min(
                            static_cast<size_t>(session.total_parts), max_reserved_parts);
                    session.parts.reserve(count);
                    session.seen_parts.reserve(count);
                }
                return true;
            }
            break;
        case line_status::unterminated:
        case line_status::end_of_input:
            return false;
        }
    }
}

void yenc_assembler::check_duplicate(yenc_part const& part) {
    if (!session.seen_parts.emplace(part.name, part.number).second) {
        std::ostringstream message;
        message << "part " << part.number << " of '" << part.name
                << "' appears more than once";
        throw yenc_error(yenc_errc::duplicate_part, message.str());
    }
}

void yenc_assembler::read_part_header(yenc_part& part) {
    while (true) {
        switch (source.next(line)) {
        case line_status::line:
            if (is_part_header(line)) {
                parse_part_header(line, part);
                return;
            }
            break;
        case line_status::unterminated:
        case line_status::end_of_input: {
            std::ostringstream message;
            message << "no =ypart line for part " << part.number << " of '" << part.name
                    << "'";
            throw yenc_error(yenc_errc::unexpected_end_of_input, message.str());
        }
        }
    }
}

void yenc_assembler::read_body(yenc_part& part, boost::crc_32_type& checksum) {
    auto& decoder = session.line_decoder;
    decoder.reset();
    while (true) {
        switch (source.next(line)) {
        case line_status::line:
            break;
        case line_status::unterminated:
        case line_status::end_of_input: {
            std::ostringstream message;
            message << "input ended before =yend of part " << part.number << " of '"
                    << part.name << "' after " << part.body.size() << " bytes";
            throw yenc_error(yenc_errc::unexpected_end_of_input, message.str());
        }
        }

        if (is_trailer(line)) {
            parse_trailer(line, part, session);
            trace("=yend size=", part.size, " pcrc32=", detail::hex32{part.crc32},
                  " crc32=", detail::hex32{session.file_crc32});
            return;
        }
        if (source.skips_framing_in_body() && (is_begin_header(line) || is_part_header(line))) {
            trace("skipping repeated header inside part ", part.number);
            continue;
        }

        auto const        start = part.body.size();
        auto const        count = decoder.decode(line, part.body);
        auto const* const first = std::next(part.body.data(), static_cast<ptrdiff_t>(start));
        checksum.process_bytes(first, count);
        session.file_checksum.process_bytes(first, count);
    }
}

void yenc_assembler::validate(yenc_part const& part, uint32_t const checksum) const {
    if (std::ssize(part.body) != part.size) {
        std::ostringstream message;
        message << "part " << part.number << " of '" << part.name << "' decoded to "
                << part.body.size() << " bytes, =yend declares " << part.size;
        throw yenc_error(yenc_errc::size_mismatch, message.str());
    }
    if (part.crc32 == 0) {
        if (options.strict_checksums) {
            std::ostringstream message;
            message << "part " << part.number << " of '" << part.name
                    << "' declares no CRC-32";
            throw yenc_error(yenc_errc::missing_checksum, message.str());
        }
        return;
    }
    if (checksum != part.crc32) {
        std::ostringstream message;
        message << "part " << part.number << " of '" << part.name << "': expected "
                << detail::hex32{part.crc32} << ", got " << detail::hex32{checksum};
        throw yenc_error(yenc_errc::checksum_mismatch, message.str());
    }
}
