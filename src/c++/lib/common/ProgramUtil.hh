//
// Propella - Two-Sample Win Rate Comparison
// Copyright (c) 2017-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief Utilities shared by the command-line programs
///

#pragma once

#include "common/Program.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/program_options.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iosfwd>


/// print usage information and exit
///
/// exits with failure status if msg is non-null
///
void
usage(
    std::ostream& os,
    const propella::Program& prog,
    const boost::program_options::options_description& visible,
    const char* desc,
    const char* afterOptions,
    const char* msg);
