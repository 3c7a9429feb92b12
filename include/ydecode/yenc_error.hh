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

#ifndef LIB_YENC_ERROR_HH
#define LIB_YENC_ERROR_HH

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

// Fatal conditions of a decoding session. End of input is not among them:
// it is reported by line_source reads and is benign between parts.
enum class yenc_errc : uint8_t {
    missing_filename = 1,
    duplicate_part,
    trailer_out_of_order,
    unexpected_end_of_input,
    size_mismatch,
    checksum_mismatch,
    missing_checksum,
    no_parts_found,
    whole_file_checksum_mismatch
};

template <>
struct std::is_error_code_enum<yenc_errc> : std::true_type {};

[[nodiscard]] std::error_category const& yenc_category() noexcept;

[[nodiscard]] std::error_code make_error_code(yenc_errc error) noexcept;

class yenc_error : public std::system_error {
public:
    yenc_error(yenc_errc error, std::string const& what_arg)
            : std::system_error(make_error_code(error), what_arg) {}

    [[nodiscard]] yenc_errc kind() const noexcept {
        return static_cast<yenc_errc>(code().value());
    }
};

#endif    // LIB_YENC_ERROR_HH
