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

#ifndef LIB_LINE_SOURCE_HH
#define LIB_LINE_SOURCE_HH

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>

enum class line_status : uint8_t {
    // A complete line was read.
    line,
    // Input ended in the middle of a line; the partial text was stored.
    unterminated,
    end_of_input
};

class line_source {
public:
    line_source()                              = default;
    line_source(line_source const&)            = delete;
    line_source(line_source&&)                 = delete;
    line_source& operator=(line_source const&) = delete;
    line_source& operator=(line_source&&)      = delete;
    virtual ~line_source()                     = default;

    // Reads the next line into `line`, without its terminator.
    virtual line_status next(std::string& line) = 0;

    // Whether stray =ybegin/=ypart lines inside a part body should be
    // skipped instead of decoded.
    [[nodiscard]] virtual bool skips_framing_in_body() const noexcept {
        return false;
    }
};

// Lines of a byte stream, terminated by "\n" with an optional "\r" before it.
class stream_line_source final : public line_source {
public:
    explicit stream_line_source(std::istream& source_in) noexcept
            : source(source_in) {}

    line_status next(std::string& line) override;

private:
    std::istream& source;
};

// Pre-split lines with their terminators already removed. The lines are
// owned by the caller and must outlive the source.
class sequence_line_source final : public line_source {
public:
    explicit sequence_line_source(std::span<std::string const> lines_in) noexcept
            : lines(lines_in) {}

    line_status next(std::string& line) override;

    [[nodiscard]] bool skips_framing_in_body() const noexcept override {
        return true;
    }

    [[nodiscard]] size_t position() const noexcept {
        return cursor;
    }

private:
    std::span<std::string const> lines;
    size_t                       cursor = 0;
};

#endif    // LIB_LINE_SOURCE_HH
