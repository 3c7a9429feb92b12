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

#include "ydecode/yenc_error.hh"

#include <string>
#include <system_error>

class yenc_category_impl final : public std::error_category {
public:
    [[nodiscard]] char const* name() const noexcept override {
        return "yenc";
    }

    [[nodiscard]] std::string message(int condition) const override {
        switch (static_cast<yenc_errc>(condition)) {
        case yenc_errc::missing_filename:
            return "yEnc header has no file name";
        case yenc_errc::duplicate_part:
            return "yEnc part was already decoded";
        case yenc_errc::trailer_out_of_order:
            return "=yend trailer does not match the current part";
        case yenc_errc::unexpected_end_of_input:
            return "input ended inside a yEnc part";
        case yenc_errc::size_mismatch:
            return "decoded size does not match the trailer size";
        case yenc_errc::checksum_mismatch:
            return "part CRC-32 mismatch";
        case yenc_errc::missing_checksum:
            return "no CRC-32 declared";
        case yenc_errc::no_parts_found:
            return "no yEnc parts found";
        case yenc_errc::whole_file_checksum_mismatch:
            return "whole file CRC-32 mismatch";
        }
        return "unknown yEnc error";
    }
};

std::error_category const& yenc_category() noexcept {
    static yenc_category_impl const instance;
    return instance;
}

std::error_code make_error_code(yenc_errc const error) noexcept {
    return {static_cast<int>(error), yenc_category()};
}
