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

#ifndef LIB_YENC_HH
#define LIB_YENC_HH

#include <ydecode/line_source.hh>
#include <ydecode/yenc_assembler.hh>
#include <ydecode/yenc_error.hh>
#include <ydecode/yenc_part.hh>
#include <ydecode/yenc_session.hh>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <vector>

// Decodes the yEnc parts found in one input. The input is consumed by the
// first call to decode_first() or decode_all(); later calls return the same
// result, or rethrow the same error. Not safe to share between threads.
class yenc {
public:
    explicit yenc(std::istream& source_in, yenc_options const& options_in = {});
    // A line sequence may be a window into data that is still arriving, so
    // the number of parts to decode must be given explicitly; 0 decodes
    // until the sequence ends. The lines are not copied and must outlive
    // the decoder; the same holds for the stream of the other constructor.
    yenc(std::span<std::string const> lines, size_t max_parts,
         yenc_options const& options_in = {});

    // Returns the first decoded part, with `total` filled in from the
    // =ybegin line. When every part of a multipart set was decoded in order,
    // the whole file CRC-32 is checked too.
    //
    // Throws yenc_error(no_parts_found) if the input has no parts, and any
    // error of the decoding session.
    [[nodiscard]] yenc_part decode_first();

    // Returns all decoded parts in the order they were found, which may be
    // none. The whole file CRC-32 is checked as in decode_first().
    std::vector<yenc_part> const& decode_all();

    // Parts that were fully validated so far; still available after a
    // failure.
    [[nodiscard]] std::vector<yenc_part> const& parts() const noexcept {
        return session.parts;
    }

    [[nodiscard]] bool multipart() const noexcept {
        return session.multipart;
    }

    // Whole file CRC-32 declared by the last =yend line, or 0.
    [[nodiscard]] uint32_t file_crc32() const noexcept {
        return session.file_crc32;
    }

    // CRC-32 of everything decoded so far.
    [[nodiscard]] uint32_t computed_file_crc32() const noexcept {
        return session.file_checksum.checksum();
    }

private:
    void run();
    [[nodiscard]] bool complete_set() const noexcept;
    void verify_file_checksum() const;

    std::unique_ptr<line_source> source;
    yenc_options                 options;
    yenc_session                 session;
    std::exception_ptr           failure;
    bool                         finished = false;
};

#endif    // LIB_YENC_HH
