/*
 * Copyright (C) Flamewing 2022 <flamewing.sonic@gmail.com>
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

#ifndef LIB_OPTIONS_LIB_HH
#define LIB_OPTIONS_LIB_HH

#include "ydecode/stream_utils.hh"
#include "ydecode/yenc.hh"

#include <getopt.h>

#include <array>
#include <charconv>
#include <concepts>    // IWYU pragma: keep
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

enum exit_status : int {
    exit_success        = 0,
    exit_usage          = 1,
    exit_bad_input      = 2,
    exit_bad_output     = 3,
    exit_bad_option     = 4,
    exit_decode_failure = 5
};

template <auto* long_options>
requires requires(decltype(long_options) opt) {
    { opt->size() } -> std::same_as<size_t>;
    { opt->data() } -> std::same_as<option const*>;
}
consteval inline auto make_short_options() {
    static_assert(long_options->back().name == nullptr);
    constexpr auto const result = [&]() consteval noexcept {
        std::array<char, 3U * (long_options->size() - 1U)> intermediate{};

        size_t length = 0;
        for (auto const& opt : *long_options) {
            if (opt.name == nullptr) {
                break;
            }
            char const val = static_cast<char>(opt.val);
            if (val == '\0') {
                // Allow options without a short form.
                continue;
            }
            intermediate[length++] = val;
            switch (opt.has_arg) {
            case no_argument:
                break;
            case optional_argument:
                intermediate[length++] = ':';
                intermediate[length++] = ':';
                break;
            case required_argument:
                intermediate[length++] = ':';
                break;
            }
        }
        return std::pair{intermediate, length};
    }();
    auto const to_init = [&]<size_t... Is>(std::index_sequence<Is...>) {
        return std::array{result.first[Is]..., '\0'};
    };
    return to_init(std::make_index_sequence<result.second>());
}

namespace detail {
    [[noreturn]] inline void print_error(
            std::errc error, std::string const& parameter, char const* value) {
        if (error == std::errc::invalid_argument) {
            std::cerr << "Invalid value '" << value << "' given for '" << parameter
                      << "' parameter!\n";
        } else if (error == std::errc::result_out_of_range) {
            std::cerr << "The value '" << value << "' given for '" << parameter
                      << "' parameter is out of range!\n";
        } else {
            std::cerr << "Unknown error happened when parsing value '" << value
                      << "' given for '" << parameter << "' parameter!\n";
        }
        throw static_cast<int>(exit_bad_option);
    }

    template <typename options_t>
    inline void parse_count(options_t& options, char const* parameter_in) {
        std::string_view const parameter(parameter_in);
        auto const* const      last = parameter.data() + parameter.size();
        auto [ptr, ec] = std::from_chars(parameter.data(), last, options.count);
        if (ec == std::errc{} && ptr != last) {
            ec = std::errc::invalid_argument;
        }
        if (ec != std::errc{}) {
            print_error(ec, "count", parameter_in);
        }
    }

    template <typename options_t>
    inline void command_argument_parser(options_t& options) {
        options.program = options.arguments.front();
        int const count = static_cast<int>(std::ssize(options.arguments));
        while (true) {
            int       option_index = 0;
            int const option_char  = getopt_long(
                    count, options.arguments.data(), options_t::short_options.data(),
                    options_t::long_options.data(), &option_index);
            if (option_char == -1) {
                break;
            }

            switch (option_char) {
            case 'a':
                options.all = true;
                break;
            case 'n':
                parse_count(options, optarg);
                break;
            case 's':
                options.strict = true;
                break;
            case 'i':
                options.info = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            default:
                break;
            }
        }
        options.positional = options.arguments.subspan(static_cast<size_t>(optind));
    }

    template <typename options_t>
    int print_usage(options_t const& options, std::ostream& out) {
        using namespace std::string_view_literals;
        auto const program = options.program.filename().string();
        out << "Usage: " << program;
        out << " [-a|--all] [-n|--count={count}] [-s|--strict] [-i|--info] [-v|--verbose]"sv;
        out << " {input_filename} [{output_filename}]\n"sv;
        out << "    Decodes the yEnc data in {input_filename} into {output_filename}.\n"sv;
        out << "    If {output_filename} is missing, the name from the =ybegin line is used.\n"sv;
        out << "        -a,--all        Write every decoded part instead of only the first.\n"sv;
        out << "        -n,--count      Stop after decoding {count} parts.\n"sv;
        out << "        -s,--strict     Fail on parts that declare no CRC-32.\n"sv;
        out << "        -i,--info       Print out name, number, size and CRC-32 of each part.\n"sv;
        out << "        -v,--verbose    Trace the decoding steps to standard error.\n"sv;
        return exit_usage;
    }

    inline void print_info(std::vector<yenc_part> const& parts, std::ostream& out) {
        for (auto const& part : parts) {
            out << part.name << " part=" << part.number << " begin=" << part.begin
                << " end=" << part.end << " size=" << part.size
                << " pcrc32=" << hex32{part.crc32} << '\n';
        }
    }

    template <typename options_t>
    inline int decode_file(options_t const& options) {
        std::filesystem::path const infile{options.positional.front()};
        std::ifstream               input(infile, std::ios::in | std::ios::binary);
        if (!input.good()) {
            std::cerr << "Input file '" << infile << "' could not be opened.\n\n";
            return exit_bad_input;
        }

        yenc_options const config{
                .max_parts        = options.count,
                .strict_checksums = options.strict,
                .trace            = options.verbose ? &std::cerr : nullptr};
        yenc                   decoder(input, config);
        std::vector<yenc_part> selected;
        try {
            if (options.all) {
                selected = decoder.decode_all();
                if (selected.empty()) {
                    throw yenc_error(yenc_errc::no_parts_found, infile.string());
                }
            } else {
                selected.push_back(decoder.decode_first());
            }
        } catch (yenc_error const& error) {
            std::cerr << "Error: " << error.what() << "\n\n";
            return exit_decode_failure;
        }

        if (options.info) {
            print_info(selected, std::cout);
        }

        std::filesystem::path const outfile
                = options.positional.size() > 1
                          ? std::filesystem::path{options.positional.back()}
                          : std::filesystem::path{selected.front().name}.filename();
        if (outfile.empty()) {
            std::cerr << "No output file name given and none usable in the input.\n\n";
            return exit_bad_output;
        }
        std::ofstream output(outfile, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!output.good()) {
            std::cerr << "Output file '" << outfile << "' could not be opened.\n\n";
            return exit_bad_output;
        }
        for (auto const& part : selected) {
            write_bytes(output, part.body);
        }
        return exit_success;
    }
}    // namespace detail

template <typename options_t>
inline int auto_decoder(options_t options) {
    try {
        detail::command_argument_parser(options);
        if (options.positional.empty() || options.positional.size() > 2) {
            detail::print_usage(options, std::cout);
            return exit_usage;
        }
        return detail::decode_file(options);
    } catch (int error) {
        return error;
    }
}

#endif    // LIB_OPTIONS_LIB_HH
