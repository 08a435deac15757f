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

#include "CWROptions.hh"

#include "blt_util/log.hh"
#include "common/ProgramUtil.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/filesystem.hpp"
#include "boost/program_options.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iostream>
#include <sstream>



static
void
usage(
    std::ostream& os,
    const propella::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "compare the win rates of two groups and recommend a decision", " > report", msg);
}



static
bool
isKnownMethod(const std::string& methodName)
{
    if (methodName == autoMethodLabel) return true;
    for (unsigned methodIndex(0); methodIndex<TEST_METHOD::SIZE; ++methodIndex)
    {
        if (methodName == TEST_METHOD::get_label(static_cast<TEST_METHOD::index_t>(methodIndex))) return true;
    }
    return false;
}



static
bool
parseAlternative(
    const std::string& label,
    ALTERNATIVE::index_t& alternative)
{
    for (unsigned altIndex(0); altIndex<ALTERNATIVE::SIZE; ++altIndex)
    {
        const ALTERNATIVE::index_t alt(static_cast<ALTERNATIVE::index_t>(altIndex));
        if (label != ALTERNATIVE::get_label(alt)) continue;
        alternative = alt;
        return true;
    }
    return false;
}



void
parseCWROptions(
    const propella::Program& prog,
    int argc,
    char* argv[],
    CWROptions& opt)
{
    AnalysisOptions& aopt(opt.analysis);
    std::string alternativeLabel(ALTERNATIVE::get_label(aopt.alternative));

    namespace po = boost::program_options;
    po::options_description groups("groups");
    groups.add_options()
    ("name-a", po::value(&opt.groupA.name)->default_value(opt.groupA.name),
     "display name of group A")
    ("trials-a", po::value(&opt.groupA.n),
     "number of trials in group A (required)")
    ("win-rate-a", po::value(&opt.groupA.winRate),
     "win rate of group A in [0,1] (required)")
    ("name-b", po::value(&opt.groupB.name)->default_value(opt.groupB.name),
     "display name of group B")
    ("trials-b", po::value(&opt.groupB.n),
     "number of trials in group B (required)")
    ("win-rate-b", po::value(&opt.groupB.winRate),
     "win rate of group B in [0,1] (required)")
    ;

    po::options_description config("configuration");
    config.add_options()
    ("alpha", po::value(&aopt.alpha)->default_value(aopt.alpha),
     "significance level in (0,1)")
    ("power", po::value(&aopt.targetPower)->default_value(aopt.targetPower),
     "target power used for the required sample size")
    ("alternative", po::value(&alternativeLabel)->default_value(alternativeLabel),
     "alternative hypothesis for group B relative to group A, one of {two-sided,greater,less}")
    ("method", po::value(&aopt.method)->default_value(aopt.method),
     "test method, one of {auto,z,chi2,fisher,permutation}. 'auto' runs the recommended method")
    ("all-methods", po::value(&aopt.isRunAllMethods)->zero_tokens(),
     "run all test methods in addition to the selected one")
    ("iterations", po::value(&aopt.permutationIterations)->default_value(aopt.permutationIterations),
     "number of resamples drawn by the permutation test")
    ("seed", po::value(&aopt.randomSeed)->default_value(aopt.randomSeed),
     "random seed of the permutation test")
    ("output-file", po::value(&opt.outputFilename)->default_value(opt.outputFilename),
     "write the report to filename, '-' for stdout")
    ;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(groups).add(config).add(help);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, visible,
                                         po::command_line_style::unix_style ^ po::command_line_style::allow_short), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if ((argc<=1) || (vm.count("help")) || po_parse_fail)
    {
        usage(log_os,prog,visible);
    }

    static const char* requiredOptions[] = { "trials-a", "win-rate-a", "trials-b", "win-rate-b" };
    for (const char* requiredOption : requiredOptions)
    {
        if (vm.count(requiredOption)) continue;
        std::ostringstream oss;
        oss << "Must specify --" << requiredOption;
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if (! parseAlternative(alternativeLabel, aopt.alternative))
    {
        std::ostringstream oss;
        oss << "Unknown alternative hypothesis: '" << alternativeLabel << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if (! isKnownMethod(aopt.method))
    {
        std::ostringstream oss;
        oss << "Unknown test method: '" << aopt.method << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if (opt.outputFilename != "-")
    {
        const boost::filesystem::path outputPath(opt.outputFilename);
        const boost::filesystem::path parentPath(outputPath.parent_path());
        if ((! parentPath.empty()) && (! boost::filesystem::is_directory(parentPath)))
        {
            std::ostringstream oss;
            oss << "Output file directory does not exist: '" << parentPath.string() << "'";
            usage(log_os,prog,visible,oss.str().c_str());
        }
    }
}
