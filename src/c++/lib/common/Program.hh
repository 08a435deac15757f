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
/// \brief Base class for all command-line programs
///

#pragma once


namespace propella
{

/// Provides the shared top-level behavior of each executable: version
/// information and last-chance exception reporting around runInternal()
///
struct Program
{
    Program() {}
    virtual ~Program() {}

    /// run the program, returns the process exit code
    int
    run(int argc, char* argv[]) const;

    virtual
    const char*
    name() const = 0;

    const char*
    version() const;

protected:
    virtual
    void
    runInternal(int argc, char* argv[]) const = 0;
};

}
