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
/// \brief Aggregate win/loss records of the two compared groups
///

#pragma once

#include <algorithm>
#include <iosfwd>
#include <string>


/// One group's aggregate win/loss record over n trials
///
/// The win count is derived from the (possibly non-integral) product n*winRate,
/// rounding half to even.
///
class Trial
{
public:
    /// throws InvalidSampleSizeException if n<=0 and InvalidRateException if
    /// winRate is not in [0,1]
    Trial(
        const int n,
        const double winRate);

    unsigned
    size() const
    {
        return _n;
    }

    /// the win rate as supplied by the caller
    double
    winRate() const
    {
        return _winRate;
    }

    double
    lossRate() const
    {
        return 1. - _winRate;
    }

    unsigned
    wins() const
    {
        return _wins;
    }

    unsigned
    losses() const
    {
        return _n - _wins;
    }

    /// the win rate realized by the integer win count, wins/n
    double
    sampleWinRate() const
    {
        return static_cast<double>(_wins) / static_cast<double>(_n);
    }

    /// unrounded win count implied by n*winRate
    double
    impliedWins() const
    {
        return static_cast<double>(_n) * _winRate;
    }

    bool
    operator==(const Trial& rhs) const
    {
        return ((_n == rhs._n) && (_winRate == rhs._winRate) && (_wins == rhs._wins));
    }

private:
    unsigned _n;
    double _winRate;
    unsigned _wins;
};

std::ostream&
operator<<(std::ostream& os, const Trial& trial);



/// The ordered pair of groups under comparison with their display names
///
/// Every report produced by the library is a pure function of a TrialPair and
/// configuration parameters.
///
struct TrialPair
{
    TrialPair(
        const std::string& initNameA,
        const Trial& initA,
        const std::string& initNameB,
        const Trial& initB)
        : nameA(initNameA)
        , nameB(initNameB)
        , a(initA)
        , b(initB)
    {}

    unsigned
    totalSize() const
    {
        return a.size() + b.size();
    }

    unsigned
    minSize() const
    {
        return std::min(a.size(), b.size());
    }

    unsigned
    maxSize() const
    {
        return std::max(a.size(), b.size());
    }

    /// sample proportion difference, wins_B/n_B - wins_A/n_A
    double
    sampleRateDifference() const
    {
        return b.sampleWinRate() - a.sampleWinRate();
    }

    /// input win rate difference, winRate_B - winRate_A
    double
    rateDifference() const
    {
        return b.winRate() - a.winRate();
    }

    bool
    operator==(const TrialPair& rhs) const
    {
        return ((nameA == rhs.nameA) && (nameB == rhs.nameB) && (a == rhs.a) && (b == rhs.b));
    }

    const std::string nameA;
    const std::string nameB;
    const Trial a;
    const Trial b;
};



/// 2x2 integer view of a TrialPair:
///
///           wins     losses
///  A        winsA    lossesA
///  B        winsB    lossesB
///
struct ContingencyTable
{
    explicit
    ContingencyTable(const TrialPair& pair);

    enum cell_t
    {
        WINS_A,
        LOSSES_A,
        WINS_B,
        LOSSES_B,
        CELL_SIZE
    };

    unsigned
    get(const cell_t cell) const
    {
        return _table[cell];
    }

    /// row-major linear layout of the table
    const unsigned*
    data() const
    {
        return _table;
    }

    unsigned
    total() const
    {
        return _table[WINS_A] + _table[LOSSES_A] + _table[WINS_B] + _table[LOSSES_B];
    }

    unsigned
    totalWins() const
    {
        return _table[WINS_A] + _table[WINS_B];
    }

    /// smallest of the four cell counts
    unsigned
    minCellCount() const;

private:
    unsigned _table[CELL_SIZE];
};

std::ostream&
operator<<(std::ostream& os, const ContingencyTable& table);
