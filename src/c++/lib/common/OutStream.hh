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
/// \brief Output stream which is either stdout or a named file
///

#pragma once

#include <fstream>
#include <iosfwd>
#include <string>


/// the filename "-" (or an empty filename) selects stdout
///
struct OutStream
{
    explicit
    OutStream(const std::string& filename);

    std::ostream&
    getStream()
    {
        return *_osPtr;
    }

private:
    std::ofstream _ofs;
    std::ostream* _osPtr;
};
