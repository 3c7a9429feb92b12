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

#ifndef TOOLS_YDEC_OPTIONS_HH
#define TOOLS_YDEC_OPTIONS_HH

#include "ydecode/options_lib.hh"

#include <array>
#include <cstddef>
#include <filesystem>
#include <span>

struct options_t {
    explicit options_t(std::span<char*> args) : arguments(args) {}

    constexpr static inline std::array const long_options{
            option{    "all",       no_argument, nullptr, 'a'},
            option{  "count", required_argument, nullptr, 'n'},
            option{ "strict",       no_argument, nullptr, 's'},
            option{   "info",       no_argument, nullptr, 'i'},
            option{"verbose",       no_argument, nullptr, 'v'},
            option{  nullptr,                 0, nullptr,   0}
    };

    constexpr static inline auto short_options = make_short_options<&long_options>();

    std::filesystem::path program;
    std::span<char*>      arguments;
    std::span<char*>      positional;

    size_t count   = 0;
    bool   all     = false;
    bool   strict  = false;
    bool   info    = false;
    bool   verbose = false;
};

#endif    // TOOLS_YDEC_OPTIONS_HH
