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

#include "common/Program.hh"
#include "common/Exceptions.hh"
#include "blt_util/log.hh"

#include <cstdlib>

#include <iostream>


#ifndef PROPELLA_VERSION
#define PROPELLA_VERSION "unknown"
#endif

#ifndef PROPELLA_CXX_COMPILER
#define PROPELLA_CXX_COMPILER "unknown"
#endif



static
void
dump_cl(
    int argc,
    char* argv[],
    std::ostream& os)
{
    os << "cmdline:";
    for (int i(0); i<argc; ++i)
    {
        os << ' ' << argv[i];
    }
    os << std::endl;
}



namespace propella
{

int
Program::
run(int argc, char* argv[]) const
{
    std::ios_base::sync_with_stdio(false);

    // last chance to catch exceptions...
    //
    try
    {
        runInternal(argc,argv);
    }
    catch (const common::ExceptionData& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << e.getContext() << ": " << e.getMessage() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc,argv,log_os);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: " << e.what() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc,argv,log_os);
        return EXIT_FAILURE;
    }
    catch (...)
    {
        log_os << "FATAL_ERROR: UNKNOWN EXCEPTION\n"
               << "...caught in program.run()\n";
        dump_cl(argc,argv,log_os);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}



const char*
Program::
version() const
{
    return PROPELLA_VERSION;
}

}
