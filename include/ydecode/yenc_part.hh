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

#ifndef LIB_YENC_PART_HH
#define LIB_YENC_PART_HH

#include <cstdint>
#include <string>
#include <vector>

// One decoded segment of a (possibly multipart) yEnc file.
struct yenc_part {
    // 1-based part index; 0 for single part streams.
    int64_t number = 0;
    // Whole file size from =ybegin; informational only.
    int64_t header_size = 0;
    // Body size from =yend; this is what the body is validated against.
    int64_t size = 0;
    // 1-based inclusive byte range of this part in the whole file (=ypart).
    int64_t begin = 0;
    int64_t end   = 0;

    std::string name;

    int64_t columns = 0;
    // Part count of the set; only set on the part returned by decode_first.
    int64_t total = 0;
    // Declared part CRC-32; 0 means none was declared.
    uint32_t crc32 = 0;

    std::vector<uint8_t> body;
};

#endif    // LIB_YENC_PART_HH
