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

#include "Scanone.hh"
#include "ScanoneOptionsParser.hh"
#include "blt_util/log.hh"
#include "common/OutStream.hh"
#include "cross/CrossGenotypeSymbols.hh"
#include "data/CrossCsvReader.hh"
#include "genotype/GenotypeEncoding.hh"
#include "scan/ScanoneResultWriter.hh"
#include "scan/ScanoneRunner.hh"

#include <iostream>
#include <memory>



static
void
runScanoneApp(const ScanoneOptions& opt)
{
    // early test that we have permission to write to output file(s)
    std::unique_ptr<OutStream> lodStream;
    std::unique_ptr<OutStream> peakStream;
    if (! opt.lodOutputFilename.empty()) lodStream.reset(new OutStream(opt.lodOutputFilename));
    if (! opt.peakOutputFilename.empty()) peakStream.reset(new OutStream(opt.peakOutputFilename));

    ObservedGenotypeRegistry registry;
    if (opt.genotypeEncodingFilename.empty())
    {
        addCrossGenotypeSymbols(opt.scanOpt.crossType, opt.genotypeCodes, opt.missingCodes, registry);
    }
    else
    {
        readGenotypeEncodingFile(opt.genotypeEncodingFilename, registry);
    }

    const CrossData crossData(readCrossCsv(opt.crossFilename, registry));
    log_os << "INFO: Read " << crossData.phenotypes.getIndividualCount() << " individuals, "
           << crossData.markers.size() << " markers and " << crossData.phenotypes.getColumnCount()
           << " phenotypes from '" << opt.crossFilename << "'\n";

    const ScanoneResult result(runScanone(crossData, opt.scanOpt));

    if (lodStream) writeLodTable(result, lodStream->getStream());
    if (peakStream) writePeakTable(result, peakStream->getStream());
}



void
Scanone::
runInternal(int argc, char* argv[]) const
{
    ScanoneOptions opt;

    parseScanoneOptions(*this, argc, argv, opt);
    runScanoneApp(opt);
}
