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

#include "scan/ScanoneResultWriter.hh"

#include <cmath>

#include <iostream>



static
void
writeValue(
    std::ostream& os,
    const double value)
{
    if (std::isnan(value))
    {
        os << "NA";
    }
    else
    {
        os << value;
    }
}



void
writeLodTable(
    const ScanoneResult& result,
    std::ostream& os)
{
    os << "chr\tpos\tmarker";
    for (const std::string& phenotypeName : result.phenotypeNames)
    {
        os << '\t' << phenotypeName;
    }
    os << '\n';

    for (const ChromosomeScanResult& chromResult : result.chromosomes)
    {
        if (chromResult.isSkipped) continue;
        for (unsigned positionIndex(0); positionIndex<chromResult.positions.size(); ++positionIndex)
        {
            const Marker& position(chromResult.positions[positionIndex]);
            os << chromResult.chromosome->getName() << '\t' << position.position << '\t' << position.name;
            for (unsigned phenotypeIndex(0); phenotypeIndex<result.phenotypeNames.size(); ++phenotypeIndex)
            {
                os << '\t';
                writeValue(os, chromResult.lod(positionIndex, phenotypeIndex));
            }
            os << '\n';
        }
    }
}



void
writePeakTable(
    const ScanoneResult& result,
    std::ostream& os)
{
    os << "chr\tphenotype\tmarker\tpos\tlod\n";

    for (const ChromosomeScanResult& chromResult : result.chromosomes)
    {
        if (chromResult.isSkipped) continue;
        for (unsigned phenotypeIndex(0); phenotypeIndex<chromResult.peaks.size(); ++phenotypeIndex)
        {
            const ScanonePeak& peak(chromResult.peaks[phenotypeIndex]);
            os << chromResult.chromosome->getName() << '\t' << result.phenotypeNames[phenotypeIndex] << '\t';
            if (peak.isDefined())
            {
                os << peak.positionName << '\t' << peak.position;
            }
            else
            {
                os << "NA\tNA";
            }
            os << '\t';
            writeValue(os, peak.lod);
            os << '\n';
        }
    }
}
