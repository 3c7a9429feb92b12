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


#include <ydecode/yenc_line_decoder.hh>

#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(line_decoder)

BOOST_AUTO_TEST_CASE(shifts_plain_bytes) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    std::string const    line{char{42}, char{43}, char{44}, char{45}, char{46}};
    BOOST_TEST(decoder.decode(line, out) == 5U);
    std::vector<uint8_t> const expected{0, 1, 2, 3, 4};
    BOOST_TEST(out == expected, boost::test_tools::per_element());
    BOOST_TEST(!decoder.pending());
}

BOOST_AUTO_TEST_CASE(every_byte_round_trips) {
    for (unsigned value = 0; value < 256U; value++) {
        auto const byte    = static_cast<uint8_t>(value);
        auto const shifted = static_cast<uint8_t>(byte + 42U);

        // Escaped form is always valid.
        {
            yenc_line_decoder    decoder;
            std::vector<uint8_t> out;
            std::string const    line{'=', static_cast<char>(static_cast<uint8_t>(shifted + 64U))};
            BOOST_TEST(decoder.decode(line, out) == 1U);
            BOOST_TEST_REQUIRE(out.size() == 1U);
            BOOST_TEST(out.front() == byte);
        }

        // The plain form of the escape character itself cannot be written.
        if (shifted != '=') {
            yenc_line_decoder    decoder;
            std::vector<uint8_t> out;
            std::string const    line(1U, static_cast<char>(shifted));
            BOOST_TEST(decoder.decode(line, out) == 1U);
            BOOST_TEST_REQUIRE(out.size() == 1U);
            BOOST_TEST(out.front() == byte);
        }
    }
}

BOOST_AUTO_TEST_CASE(output_shrinks_by_escape_count) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    std::string const    line = "ab=}cd=@";
    BOOST_TEST(decoder.decode(line, out) == line.size() - 2U);
    BOOST_TEST(out.size() == line.size() - 2U);
    BOOST_TEST(out[2] == uint8_t{'=' - 42});
    BOOST_TEST(out[5] == uint8_t{0xd6});
}

BOOST_AUTO_TEST_CASE(escape_carries_into_next_line) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    BOOST_TEST(decoder.decode("*=", out) == 1U);
    BOOST_TEST(decoder.pending());
    // '}' is the partner of an escaped '=', which decodes to 19.
    BOOST_TEST(decoder.decode("}*", out) == 2U);
    BOOST_TEST(!decoder.pending());
    std::vector<uint8_t> const expected{0, 19, 0};
    BOOST_TEST(out == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(empty_line_keeps_pending_escape) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    BOOST_TEST(decoder.decode("=", out) == 0U);
    BOOST_TEST(decoder.decode("", out) == 0U);
    BOOST_TEST(decoder.pending());
    BOOST_TEST(decoder.decode("J", out) == 1U);
    BOOST_TEST_REQUIRE(out.size() == 1U);
    // 224 + 42 wraps to '\n', which is always escaped.
    BOOST_TEST(out.front() == uint8_t{224});
}

BOOST_AUTO_TEST_CASE(reset_drops_pending_escape) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    BOOST_TEST(decoder.decode("=", out) == 0U);
    decoder.reset();
    BOOST_TEST(!decoder.pending());
    BOOST_TEST(decoder.decode("+", out) == 1U);
    BOOST_TEST(out.front() == uint8_t{1});
}

BOOST_AUTO_TEST_CASE(arithmetic_wraps_around) {
    yenc_line_decoder    decoder;
    std::vector<uint8_t> out;
    std::string const    line{char{0}, char{41}, '=', char{0}};
    BOOST_TEST(decoder.decode(line, out) == 3U);
    std::vector<uint8_t> const expected{214, 255, 150};
    BOOST_TEST(out == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_SUITE_END()
