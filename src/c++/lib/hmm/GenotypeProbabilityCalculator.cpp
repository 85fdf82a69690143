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

#include "hmm/GenotypeProbabilityCalculator.hh"

#include "blt_util/logSumUtil.hh"
#include "common/Exceptions.hh"

#include <cmath>

#include <algorithm>
#include <map>
#include <sstream>



using namespace qtlmap::common;



static
void
checkInputs(
    const GenotypeMatrix& genotypes,
    const std::vector<Marker>& positions,
    const std::vector<double>& recFracs,
    const double errorProb)
{
    if (! ((errorProb > 0.) && (errorProb < 1.)))
    {
        std::ostringstream oss;
        oss << "Genotyping error probability must be in (0,1), found: " << errorProb;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const unsigned expectedRecFracCount(positions.empty() ? 0 : (positions.size()-1));
    if (recFracs.size() != expectedRecFracCount)
    {
        std::ostringstream oss;
        oss << "Found " << recFracs.size() << " recombination fractions for " << positions.size()
            << " positions";
        BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
    }

    for (const Marker& position : positions)
    {
        if (position.isPseudomarker()) continue;
        if (static_cast<unsigned>(position.genotypeColumn) < genotypes.getColumnCount()) continue;

        std::ostringstream oss;
        oss << "Marker '" << position.name << "' refers to genotype column " << position.genotypeColumn
            << ", genotype matrix has " << genotypes.getColumnCount() << " columns";
        BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
    }
}



namespace
{

/// Emission log probabilities are computed once per distinct symbol of the chromosome
class EmissionCache
{
public:
    EmissionCache(
        const CrossModel& crossModel,
        const double errorProb)
        : _crossModel(crossModel),
          _errorProb(errorProb),
          _unobserved(crossModel.getGenotypeCount(), 0.)
    {}

    const std::vector<double>&
    getEmission(const GenotypeSymbolRef& symbol)
    {
        if (! symbol) return _unobserved;

        std::vector<double>& emission(_cache[symbol.get()]);
        if (emission.empty())
        {
            _crossModel.getEmissionLogProbs(*symbol, _errorProb, emission);
        }
        return emission;
    }

    /// emission of a position without observation
    const std::vector<double>&
    getUnobserved() const
    {
        return _unobserved;
    }

private:
    const CrossModel& _crossModel;
    const double _errorProb;
    const std::vector<double> _unobserved;
    std::map<const GenotypeSymbolMapper*,std::vector<double>> _cache;
};

}



GenotypeProbabilityTensor
calcGenotypeProbabilities(
    const CrossModel& crossModel,
    const GenotypeMatrix& genotypes,
    const std::vector<Marker>& positions,
    const std::vector<double>& recFracs,
    const double errorProb)
{
    checkInputs(genotypes, positions, recFracs, errorProb);

    const unsigned individualCount(genotypes.getIndividualCount());
    const unsigned positionCount(positions.size());
    const unsigned genotypeCount(crossModel.getGenotypeCount());

    GenotypeProbabilityTensor probs(individualCount, positionCount, genotypeCount);
    if (positionCount == 0) return probs;

    std::vector<double> initLogProbs(genotypeCount);
    for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
    {
        initLogProbs[genotypeIndex] = crossModel.init(genotypeIndex);
    }

    // one transition kernel per interval:
    std::vector<std::vector<double>> transitions(recFracs.size());
    for (unsigned intervalIndex(0); intervalIndex<recFracs.size(); ++intervalIndex)
    {
        try
        {
            crossModel.getTransitionLogProbs(recFracs[intervalIndex], transitions[intervalIndex]);
        }
        catch (boost::exception& e)
        {
            e << errinfo_position(positions[intervalIndex+1].name);
            throw;
        }
    }

    EmissionCache emissionCache(crossModel, errorProb);
    std::vector<double> alpha(genotypeCount);
    std::vector<double> prevAlpha(genotypeCount);
    std::vector<double> terms(genotypeCount);

    for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
    {
        for (unsigned positionIndex(0); positionIndex<positionCount; ++positionIndex)
        {
            const Marker& position(positions[positionIndex]);
            try
            {
                const std::vector<double>& emission(position.isPseudomarker() ?
                                                    emissionCache.getUnobserved() :
                                                    emissionCache.getEmission(genotypes.get(individualIndex,
                                                            position.genotypeColumn)));

                if (positionIndex == 0)
                {
                    for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
                    {
                        alpha[genotypeIndex] = initLogProbs[genotypeIndex] + emission[genotypeIndex];
                    }
                }
                else
                {
                    const std::vector<double>& transition(transitions[positionIndex-1]);
                    for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
                    {
                        for (unsigned prevGenotypeIndex(0); prevGenotypeIndex<genotypeCount; ++prevGenotypeIndex)
                        {
                            terms[prevGenotypeIndex] = prevAlpha[prevGenotypeIndex] +
                                                       transition[prevGenotypeIndex*genotypeCount+genotypeIndex];
                        }
                        alpha[genotypeIndex] = emission[genotypeIndex] + getLogSumSequence(terms);
                    }
                }

                double* probRow(probs.getRow(individualIndex, positionIndex));
                std::copy(alpha.begin(), alpha.end(), probRow);
                const double logSum(normalizeLogDistro(probRow, probRow+genotypeCount));
                if (std::isinf(logSum))
                {
                    BOOST_THROW_EXCEPTION(GeneralException("Genotype probabilities have zero total mass"));
                }

                // alpha is kept normalized so that the log values stay in range over long chromosomes
                for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
                {
                    prevAlpha[genotypeIndex] = alpha[genotypeIndex] - logSum;
                }
            }
            catch (boost::exception& e)
            {
                e << errinfo_individual(individualIndex) << errinfo_position(position.name);
                throw;
            }
        }
    }

    return probs;
}
