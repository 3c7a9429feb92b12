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

#include "ydecode/yenc.hh"

#include "ydecode/stream_utils.hh"

#include <exception>
#include <istream>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

yenc::yenc(std::istream& source_in, yenc_options const& options_in)
        : source(std::make_unique<stream_line_source>(source_in)), options(options_in) {}

yenc::yenc(
        std::span<std::string const> lines, size_t const max_parts,
        yenc_options const& options_in)
        : source(std::make_unique<sequence_line_source>(lines)), options(options_in) {
    options.max_parts = max_parts;
}

void yenc::run() {
    if (failure) {
        std::rethrow_exception(failure);
    }
    if (finished) {
        return;
    }
    finished = true;
    try {
        yenc_assembler assembler(*source, session, options);
        assembler.run();
        if (complete_set()) {
            verify_file_checksum();
        }
    } catch (...) {
        // Parts appended before the failure must not pass for a full result.
        failure = std::current_exception();
        throw;
    }
}

// Parts arrive in order, so a set is complete when the last part number
// matches the count, and the count matches total= when one was declared.
bool yenc::complete_set() const noexcept {
    auto const& decoded = session.parts;
    auto const  count   = std::ssize(decoded);
    return session.multipart && count > 1 && decoded.back().number == count
           && (session.total_parts == 0 || session.total_parts == count);
}

void yenc::verify_file_checksum() const {
    auto const computed = session.file_checksum.checksum();
    if (session.file_crc32 == 0) {
        if (options.strict_checksums) {
            std::ostringstream message;
            message << "no =yend line of '" << session.parts.front().name
                    << "' declares a whole file CRC-32";
            throw yenc_error(yenc_errc::missing_checksum, message.str());
        }
        return;
    }
    if (computed != session.file_crc32) {
        std::ostringstream message;
        message << "'" << session.parts.front().name << "' (" << session.parts.size()
                << " parts): expected " << detail::hex32{session.file_crc32} << ", got "
                << detail::hex32{computed};
        throw yenc_error(yenc_errc::whole_file_checksum_mismatch, message.str());
    }
    if (options.trace != nullptr) {
        *options.trace << "yenc: whole file CRC-32 " << detail::hex32{computed}
                       << " verified over " << session.parts.size() << " parts\n";
    }
}

yenc_part yenc::decode_first() {
    run();
    if (session.parts.empty()) {
        throw yenc_error(yenc_errc::no_parts_found, "decode_first");
    }
    yenc_part result = session.parts.front();
    if (session.total_parts > 0) {
        result.total = session.total_parts;
    }
    return result;
}

std::vector<yenc_part> const& yenc::decode_all() {
    run();
    return session.parts;
}
