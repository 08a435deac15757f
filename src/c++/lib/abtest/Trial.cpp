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

#include "abtest/Trial.hh"
#include "common/Exceptions.hh"

#include <algorithm>
#include <cmath>

#include <iostream>
#include <sstream>



Trial::
Trial(
    const int n,
    const double winRate)
    : _n(0)
    , _winRate(winRate)
    , _wins(0)
{
    using namespace propella::common;

    if (n <= 0)
    {
        std::ostringstream oss;
        oss << "Trial count must be a positive integer, got: " << n;
        BOOST_THROW_EXCEPTION(InvalidSampleSizeException(oss.str()));
    }

    // the negated form also rejects NaN:
    if (! ((winRate >= 0.) && (winRate <= 1.)))
    {
        std::ostringstream oss;
        oss << "Win rate must be in [0,1], got: " << winRate;
        BOOST_THROW_EXCEPTION(InvalidRateException(oss.str()));
    }

    _n = static_cast<unsigned>(n);

    // nearbyint under the default rounding mode rounds half to even
    const double roundedWins(std::nearbyint(impliedWins()));
    _wins = std::min(_n, static_cast<unsigned>(std::max(0., roundedWins)));
}



std::ostream&
operator<<(std::ostream& os, const Trial& trial)
{
    os << "n: " << trial.size()
       << " winRate: " << trial.winRate()
       << " wins: " << trial.wins()
       << " losses: " << trial.losses();
    return os;
}



ContingencyTable::
ContingencyTable(const TrialPair& pair)
{
    _table[WINS_A] = pair.a.wins();
    _table[LOSSES_A] = pair.a.losses();
    _table[WINS_B] = pair.b.wins();
    _table[LOSSES_B] = pair.b.losses();
}



unsigned
ContingencyTable::
minCellCount() const
{
    return *std::min_element(_table, _table+CELL_SIZE);
}



std::ostream&
operator<<(std::ostream& os, const ContingencyTable& table)
{
    os << "[[" << table.get(ContingencyTable::WINS_A) << ", " << table.get(ContingencyTable::LOSSES_A) << "], "
       << "[" << table.get(ContingencyTable::WINS_B) << ", " << table.get(ContingencyTable::LOSSES_B) << "]]";
    return os;
}
