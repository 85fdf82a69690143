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
/// \brief hidden Markov model genotype probabilities along one chromosome
///

#pragma once

#include "cross/CrossModel.hh"
#include "data/CrossData.hh"
#include "hmm/GenotypeProbabilityTensor.hh"
#include "map/Marker.hh"

#include <vector>


/// Compute the genotype probabilities of every individual at every position of one chromosome
///
/// This runs the forward recursion only:
///
///   alpha[0][g] = init(g) + emit(obs[0], g)
///   alpha[k][g] = emit(obs[k], g) + logsum_g' (alpha[k-1][g'] + step(g', g, r[k-1]))
///
/// and normalizes each alpha[k] into probabilities, which yields the genotype distribution given the
/// observations up to position k. Pseudomarker positions have no observation.
///
/// \param positions markers and pseudomarkers of one chromosome, sorted by position
/// \param recFracs recombination fraction of each adjacent position pair, one less than the position count
/// \param errorProb genotyping error probability, must lie strictly between 0 and 1
///
/// Throws DimensionMismatchException if recFracs or a marker genotype column do not match the inputs, and
/// IncompatibleCrossException (tagged with the individual and position) for observations outside the cross.
GenotypeProbabilityTensor
calcGenotypeProbabilities(
    const CrossModel& crossModel,
    const GenotypeMatrix& genotypes,
    const std::vector<Marker>& positions,
    const std::vector<double>& recFracs,
    const double errorProb);
