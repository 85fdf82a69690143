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
/// \brief Haley-Knott regression genome scan for a single QTL
///
/// At each scan position the phenotypes are regressed on the genotype probabilities of the individuals, which
/// stand in for the unknown true genotypes. The residual sum of squares (RSS) is compared with the RSS of a
/// null model without any genotype terms to obtain a LOD score.
///

#pragma once

#include "data/CrossData.hh"
#include "hmm/GenotypeProbabilityTensor.hh"
#include "map/Marker.hh"

#include "Eigen/Dense"

#include <cmath>

#include <limits>
#include <string>
#include <vector>


/// Fit the null model (intercept and additive covariates) to every phenotype
///
/// \param addcovar additive covariates, may have zero columns
/// \param weights per-individual weights w of a weighted least squares fit minimizing sum(w*r^2), empty for an
///                unweighted fit. Weights must be finite and non-negative.
///
/// \return RSS of each phenotype
///
/// Throws DimensionMismatchException if the row counts disagree, DegenerateDesignException if the null design
/// is rank deficient and InvalidParameterException if any phenotype is missing.
std::vector<double>
scanoneHKNull(
    const PhenotypeMatrix& phenotypes,
    const CovariateMatrix& addcovar,
    const std::vector<double>& weights);


/// Haley-Knott scan of one chromosome
///
/// The design at each position holds an intercept, the probability of every genotype except
/// \p baselineGenotypeIndex, the additive covariates and the product of each interactive covariate with each
/// of those genotype probabilities. Interactive covariates must also be present in \p addcovar for their main
/// effect to be modeled. The RSS does not depend on the choice of baseline genotype.
///
/// A position with a rank deficient design has RSS NaN, the scan continues with the next position.
///
/// \return RSS as a positions x phenotypes matrix
Eigen::MatrixXd
scanoneHK(
    const GenotypeProbabilityTensor& genotypeProbs,
    const PhenotypeMatrix& phenotypes,
    const CovariateMatrix& addcovar,
    const CovariateMatrix& intcovar,
    const std::vector<double>& weights,
    const unsigned baselineGenotypeIndex = 0);


/// LOD score of one fit: (n/2) log10(rss0/rss)
double
rssToLod(
    const double rss,
    const double rss0,
    const unsigned individualCount);


/// convert a positions x phenotypes RSS matrix into LOD scores, NaN RSS values stay NaN
///
/// throws DimensionMismatchException if \p rss0 does not have one value per phenotype
Eigen::MatrixXd
rssToLod(
    const Eigen::MatrixXd& rss,
    const std::vector<double>& rss0,
    const unsigned individualCount);


/// Maximum LOD of one phenotype along a chromosome
struct ScanonePeak
{
    bool
    isDefined() const
    {
        return (! std::isnan(lod));
    }

    unsigned positionIndex = 0;
    std::string positionName;

    /// map position in cM
    double position = 0.;
    double lod = std::numeric_limits<double>::quiet_NaN();
};


/// find the peak of each phenotype
///
/// NaN LOD values are ignored and the first position reaching the maximum wins. A phenotype without any
/// defined LOD value gets an undefined peak.
///
/// throws DimensionMismatchException if the LOD row count differs from the position count
std::vector<ScanonePeak>
getPeaks(
    const Eigen::MatrixXd& lod,
    const std::vector<Marker>& positions);
