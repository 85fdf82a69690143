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

#pragma once

#include "scan/ScanOptions.hh"

#include <string>


struct ScanoneOptions
{
    //========= input files:
    /// cross data in R/qtl csv layout
    std::string crossFilename;

    /// optional GENOTYPE definitions replacing the default cross alphabet
    std::string genotypeEncodingFilename;

    /// observed genotype codes in cross order, empty selects the cross default
    std::string genotypeCodes;
    std::string missingCodes = "NA -";

    //========= output files:
    std::string lodOutputFilename;
    std::string peakOutputFilename;

    ScanOptions scanOpt;
};
