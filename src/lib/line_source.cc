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

#include "ydecode/line_source.hh"

#include <istream>
#include <string>

line_status stream_line_source::next(std::string& line) {
    line.clear();
    if (!std::getline(source, line)) {
        // Nothing was extracted.
        return line_status::end_of_input;
    }
    if (source.eof()) {
        // getline stopped at end of file, not at a '\n'.
        return line_status::unterminated;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line_status::line;
}

line_status sequence_line_source::next(std::string& line) {
    if (cursor >= lines.size()) {
        line.clear();
        return line_status::end_of_input;
    }
    line = lines[cursor++];
    return line_status::line;
}
