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
/// \brief per-cross hidden Markov model probabilities
///
/// For each cross design this provides the three log-probability functions used by the genotype probability
/// recursion: the marginal genotype distribution (init), the genotyping error model (emit) and the two-locus
/// transition kernel (step).
///

#pragma once

#include "cross/CrossType.hh"
#include "genotype/GenotypeSymbolMapper.hh"

#include <vector>


/// Cross model descriptor, immutable and shared by every chromosome of an analysis run
///
/// Genotype indices refer to getPossibleGenotypes():
///   F2: (0,0) (0,1) (1,1)
///   BC: (0,0) (0,1)
///   RISELF, RISIB: (0,0) (1,1)
///
/// Crosses in this set cannot distinguish allele phase, so (1,0) resolves to the same genotype index as (0,1).
///
class CrossModel
{
public:
    explicit
    CrossModel(const CROSS_TYPE::index_t crossType);

    CROSS_TYPE::index_t
    getCrossType() const
    {
        return _crossType;
    }

    const std::vector<TrueGenotype>&
    getPossibleGenotypes() const
    {
        return _possibleGenotypes;
    }

    unsigned
    getGenotypeCount() const
    {
        return _possibleGenotypes.size();
    }

    /// \return the possible genotype index of \p genotype
    ///
    /// throws IncompatibleCrossException if the genotype cannot occur in this cross
    unsigned
    getGenotypeIndex(const TrueGenotype& genotype) const;

    /// marginal log probability of genotype \p genotypeIndex
    double
    init(const unsigned genotypeIndex) const;

    /// log probability of the observed symbol given the true genotype
    ///
    /// A missing observation has log probability 0. A symbol compatible with k true genotypes shares the
    /// no-error mass among them: log(1-errorProb/k). An incompatible genotype receives
    /// log(errorProb) - log(n-1), where n is the number of possible genotypes.
    ///
    /// throws IncompatibleCrossException if the symbol refers to a true genotype outside of this cross
    double
    emit(
        const GenotypeSymbolMapper& observed,
        const unsigned genotypeIndex,
        const double errorProb) const;

    /// log transition probability from the left to the right genotype across recombination fraction \p recFrac
    double
    step(
        const unsigned leftGenotypeIndex,
        const unsigned rightGenotypeIndex,
        const double recFrac) const;

    double
    init(const TrueGenotype& genotype) const
    {
        return init(getGenotypeIndex(genotype));
    }

    double
    emit(
        const GenotypeSymbolMapper& observed,
        const TrueGenotype& genotype,
        const double errorProb) const
    {
        return emit(observed, getGenotypeIndex(genotype), errorProb);
    }

    double
    step(
        const TrueGenotype& leftGenotype,
        const TrueGenotype& rightGenotype,
        const double recFrac) const
    {
        return step(getGenotypeIndex(leftGenotype), getGenotypeIndex(rightGenotype), recFrac);
    }

    /// emission log probabilities of \p observed for every possible genotype
    void
    getEmissionLogProbs(
        const GenotypeSymbolMapper& observed,
        const double errorProb,
        std::vector<double>& emission) const;

    /// transition kernel for one interval, stored row-major as [left*genotypeCount+right]
    void
    getTransitionLogProbs(
        const double recFrac,
        std::vector<double>& transition) const;

private:
    void
    checkGenotypeIndex(const unsigned genotypeIndex) const;

    /// flag every possible genotype compatible with \p observed
    ///
    /// \return number of compatible genotypes
    unsigned
    getCompatibleGenotypes(
        const GenotypeSymbolMapper& observed,
        std::vector<bool>& isCompatible) const;

    CROSS_TYPE::index_t _crossType;
    std::vector<TrueGenotype> _possibleGenotypes;
};
