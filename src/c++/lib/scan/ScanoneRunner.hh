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

/// \file
/// \brief genome-wide single-QTL scan over all chromosomes of a cross
///

#pragma once

#include "cross/CrossModel.hh"
#include "data/CrossData.hh"
#include "scan/ScanOptions.hh"
#include "scan/ScanoneHK.hh"

#include "Eigen/Dense"

#include <string>
#include <vector>


/// Scan result of one chromosome
struct ChromosomeScanResult
{
    ChromosomeRef chromosome;

    /// markers and pseudomarkers of the chromosome, sorted by position
    std::vector<Marker> positions;

    /// LOD scores, positions x phenotypes
    Eigen::MatrixXd lod;

    /// one peak per phenotype
    std::vector<ScanonePeak> peaks;

    /// positions with a rank deficient design, their LOD is NaN
    unsigned degeneratePositionCount = 0;

    /// set for chromosomes which were not scanned (sex chromosomes)
    bool isSkipped = false;
};


/// A peak reported above the LOD threshold
struct ReportedPeak
{
    ChromosomeRef chromosome;
    unsigned phenotypeIndex = 0;
    ScanonePeak peak;
};


struct ScanoneResult
{
    /// peaks above \p lodThreshold in chromosome then phenotype order
    std::vector<ReportedPeak>
    getPeaksAboveThreshold(const double lodThreshold) const;

    std::vector<std::string> phenotypeNames;

    /// individuals removed before the scan because a phenotype was missing
    unsigned omittedIndividualCount = 0;

    /// individuals used in the scan
    unsigned individualCount = 0;

    /// in order of first appearance of each chromosome in the input markers
    std::vector<ChromosomeScanResult> chromosomes;
};


/// Scan one chromosome
///
/// \param genotypes genotypes of the individuals in \p phenotypes
/// \param rss0 null model RSS of each phenotype
ChromosomeScanResult
scanChromosome(
    const CrossModel& crossModel,
    const ChromosomeMarkers& chromosomeMarkers,
    const GenotypeMatrix& genotypes,
    const PhenotypeMatrix& phenotypes,
    const std::vector<double>& rss0,
    const ScanOptions& options);


/// Run the full genome scan
///
/// Individuals missing any phenotype are omitted, pseudomarkers are inserted, the null model is fit once and
/// then every autosome is scanned as an independent unit of work, using up to options.threadCount threads.
/// Exceptions escaping a chromosome are tagged with the chromosome name.
ScanoneResult
runScanone(
    const CrossData& crossData,
    const ScanOptions& options);
