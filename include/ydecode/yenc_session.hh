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

#ifndef LIB_YENC_SESSION_HH
#define LIB_YENC_SESSION_HH

#include "ydecode/yenc_line_decoder.hh"
#include "ydecode/yenc_part.hh"

#include <boost/container_hash/hash.hpp>
#include <boost/crc.hpp>

#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// Everything that lives for one decoding session, as opposed to one part.
struct yenc_session {
    using part_key = std::pair<std::string, int64_t>;

    // Set by the first =ybegin carrying a part= attribute.
    bool multipart = false;
    // From total=; only used for sizing and to annotate the first part.
    int64_t total_parts = 0;
    // Whole file CRC-32 declared by the latest =yend; 0 if none.
    uint32_t file_crc32 = 0;

    // Covers every decoded byte of every part, in decoding order.
    boost::crc_32_type file_checksum;

    yenc_line_decoder line_decoder;

    std::vector<yenc_part> parts;

    std::unordered_set<part_key, boost::hash<part_key>> seen_parts;
};

#endif    // LIB_YENC_SESSION_HH
