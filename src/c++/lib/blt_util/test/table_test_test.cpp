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


#include "boost/test/unit_test.hpp"

#include "blt_util/table_test.hh"


BOOST_AUTO_TEST_SUITE( test_table_test )


BOOST_AUTO_TEST_CASE( test_table_chi_sqr_2x2 )
{
    static const double eps(0.0001);

    static const unsigned table[] = { 12, 5, 9, 7 };

    const chi_sqr_result yates(table_chi_sqr_2x2(table));
    BOOST_REQUIRE(yates.isDefined);
    BOOST_REQUIRE_EQUAL(yates.df, 1u);
    BOOST_REQUIRE_CLOSE(yates.xsq, 0.243730304622, eps);
    BOOST_REQUIRE_CLOSE(yates.pval, 0.621524779159, eps);

    const chi_sqr_result pearson(table_chi_sqr_2x2(table, false));
    BOOST_REQUIRE_CLOSE(pearson.xsq, 0.732274159664, eps);
    BOOST_REQUIRE_CLOSE(pearson.pval, 0.392147036600, eps);
}


BOOST_AUTO_TEST_CASE( test_table_chi_sqr_2x2_reject )
{
    static const double alpha(0.01);

    static const unsigned table1[] = { 1, 9, 11, 3 };
    static const unsigned table2[] = { 12, 5, 9, 7 };

    BOOST_REQUIRE_CLOSE(table_chi_sqr_2x2(table1).xsq, 8.4, 0.0001);
    BOOST_REQUIRE(table_chi_sqr_2x2(table1).pval < alpha);
    BOOST_REQUIRE(table_chi_sqr_2x2(table2).pval >= alpha);
}


BOOST_AUTO_TEST_CASE( test_table_chi_sqr_2x2_empty_margin )
{
    static const unsigned emptyColumn[] = { 10, 0, 20, 0 };
    static const unsigned emptyRow[] = { 0, 0, 20, 5 };
    static const unsigned emptyTable[] = { 0, 0, 0, 0 };

    BOOST_REQUIRE(! table_chi_sqr_2x2(emptyColumn).isDefined);
    BOOST_REQUIRE(! table_chi_sqr_2x2(emptyRow).isDefined);
    BOOST_REQUIRE(! table_chi_sqr_2x2(emptyTable).isDefined);
}


BOOST_AUTO_TEST_SUITE_END()
