//
// QtlMap - QTL Mapping for Experimental Crosses
// Copyright (c) 2009-2018 Illumina, Inc.
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

#include "ScanoneOptionsParser.hh"
#include "blt_util/log.hh"
#include "common/Exceptions.hh"
#include "common/ProgramUtil.hh"
#include "cross/CrossGenotypeSymbols.hh"

#include "boost/filesystem.hpp"
#include "boost/program_options.hpp"

#include <iostream>
#include <sstream>



static
void
usage(
    std::ostream& os,
    const qtlmap::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "Single QTL genome scan by Haley-Knott regression", "", msg);
}



void
parseScanoneOptions(
    const qtlmap::Program& prog,
    int argc,
    char** argv,
    ScanoneOptions& opt)
{
    namespace po = boost::program_options;

    std::string crossTypeLabel;
    std::string mapFunctionLabel(MAP_FUNCTION::label(opt.scanOpt.mapFunction));
    std::string pseudomarkerPolicyLabel(PSEUDOMARKER_POLICY::label(opt.scanOpt.pseudomarkerPolicy));

    po::options_description input("input");
    input.add_options()
    ("cross-file", po::value(&opt.crossFilename),
     "cross data file in R/qtl csv layout (required)")
    ("cross-type", po::value(&crossTypeLabel),
     "cross design, one of: F2 BC RISELF RISIB (required)")
    ("genotype-codes", po::value(&opt.genotypeCodes),
     "observed genotype codes in cross order, separated by spaces (default: 'A H B D C' for F2, 'A H' for BC, 'A B' for RI)")
    ("missing-codes", po::value(&opt.missingCodes)->default_value(opt.missingCodes),
     "missing genotype codes, separated by spaces")
    ("genotype-encoding-file", po::value(&opt.genotypeEncodingFilename),
     "file of 'GENOTYPE name[,alias...] as a,b ...' definitions, replaces the genotype and missing codes")
    ;

    po::options_description scan("scan");
    scan.add_options()
    ("map-function", po::value(&mapFunctionLabel)->default_value(mapFunctionLabel),
     "genetic map function, one of: haldane kosambi morgan")
    ("step", po::value(&opt.scanOpt.stepSize)->default_value(opt.scanOpt.stepSize),
     "pseudomarker spacing in cM")
    ("pseudomarker-policy", po::value(&pseudomarkerPolicyLabel)->default_value(pseudomarkerPolicyLabel),
     "pseudomarker placement, 'minimal' fills only gaps wider than the step, 'stepped' uses a regular grid")
    ("error-prob", po::value(&opt.scanOpt.errorProb)->default_value(opt.scanOpt.errorProb),
     "genotyping error probability")
    ("lod-threshold", po::value(&opt.scanOpt.lodThreshold)->default_value(opt.scanOpt.lodThreshold),
     "report peaks with LOD above this value")
    ("threads", po::value(&opt.scanOpt.threadCount)->default_value(opt.scanOpt.threadCount),
     "number of chromosomes scanned in parallel")
    ;

    po::options_description output("output");
    output.add_options()
    ("lod-output-file", po::value(&opt.lodOutputFilename),
     "write the LOD score of every scan position to this file, '-' for stdout")
    ("peak-output-file", po::value(&opt.peakOutputFilename),
     "write the peak of every chromosome and phenotype to this file, '-' for stdout")
    ;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(input).add(scan).add(output).add(help);

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

    if (opt.crossFilename.empty())
    {
        usage(log_os,prog,visible, "Must specify a cross file");
    }
    if (! boost::filesystem::exists(opt.crossFilename))
    {
        std::ostringstream oss;
        oss << "Cross file does not exist: '" << opt.crossFilename << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if ((! opt.genotypeEncodingFilename.empty()) && (! boost::filesystem::exists(opt.genotypeEncodingFilename)))
    {
        std::ostringstream oss;
        oss << "Genotype encoding file does not exist: '" << opt.genotypeEncodingFilename << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if (crossTypeLabel.empty())
    {
        usage(log_os,prog,visible, "Must specify a cross type");
    }

    try
    {
        opt.scanOpt.crossType = CROSS_TYPE::parse(crossTypeLabel);
        opt.scanOpt.mapFunction = MAP_FUNCTION::parse(mapFunctionLabel);
        opt.scanOpt.pseudomarkerPolicy = PSEUDOMARKER_POLICY::parse(pseudomarkerPolicyLabel);
    }
    catch (const qtlmap::common::InvalidParameterException& e)
    {
        usage(log_os,prog,visible,e.what());
    }

    if (opt.genotypeCodes.empty())
    {
        opt.genotypeCodes = getDefaultGenotypeCodes(opt.scanOpt.crossType);
    }

    if (! (opt.scanOpt.stepSize > 0.))
    {
        usage(log_os,prog,visible, "Pseudomarker step must be greater than 0");
    }

    if (! ((opt.scanOpt.errorProb > 0.) && (opt.scanOpt.errorProb < 1.)))
    {
        usage(log_os,prog,visible, "Genotyping error probability must be in range (0, 1)");
    }

    if (opt.scanOpt.threadCount < 1)
    {
        usage(log_os,prog,visible, "Thread count must be at least 1");
    }

    if (opt.lodOutputFilename.empty() && opt.peakOutputFilename.empty())
    {
        usage(log_os,prog,visible, "Must specify at least one of the LOD or peak output files");
    }
    if ((opt.lodOutputFilename == "-") && (opt.peakOutputFilename == "-"))
    {
        usage(log_os,prog,visible, "LOD and peak output can't both be written to stdout");
    }
}
