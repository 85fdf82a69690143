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

#include "cross/CrossModel.hh"

#include "blt_util/math_util.hh"
#include "common/Exceptions.hh"

#include "boost/math/constants/constants.hpp"

#include <cmath>

#include <sstream>



static const double ln2(boost::math::constants::ln_two<double>());


namespace F2_GT
{
enum index_t
{
    AA,
    AB,
    BB
};
}

namespace INBRED_GT
{
enum index_t
{
    AA,
    BB
};
}

namespace BC_GT
{
enum index_t
{
    AA,
    AB
};
}



static
void
throwIncompatibleGenotype(
    const CROSS_TYPE::index_t crossType,
    const TrueGenotype& genotype)
{
    std::ostringstream oss;
    oss << "True genotype " << genotype << " is not possible in cross type " << crossType;
    BOOST_THROW_EXCEPTION(qtlmap::common::IncompatibleCrossException(oss.str()));
}



/// F2 intercross two-locus kernel, built from the number of recombinant gametes between the loci
static
double
stepF2(
    const F2_GT::index_t left,
    const F2_GT::index_t right,
    const double recFrac)
{
    using namespace F2_GT;

    switch (left)
    {
    case AA:
        switch (right)
        {
        case AA:
            return 2.0*log1m(recFrac);
        case AB:
            return ln2 + log1m(recFrac) + std::log(recFrac);
        case BB:
            return 2.0*std::log(recFrac);
        }
        break;
    case AB:
        switch (right)
        {
        case AA:
        case BB:
            return std::log(recFrac) + log1m(recFrac);
        case AB:
            return std::log((1.0-recFrac)*(1.0-recFrac) + recFrac*recFrac);
        }
        break;
    case BB:
        switch (right)
        {
        case AA:
            return 2.0*std::log(recFrac);
        case AB:
            return ln2 + log1m(recFrac) + std::log(recFrac);
        case BB:
            return 2.0*log1m(recFrac);
        }
        break;
    }

    std::ostringstream oss;
    oss << "Unhandled F2 genotype transition: " << static_cast<int>(left) << " -> " << static_cast<int>(right);
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException(oss.str()));
}



/// two-state kernel shared by backcross and recombinant inbred designs, \p switchProb is the probability of
/// observing different genotypes at the two loci
static
double
stepTwoState(
    const unsigned left,
    const unsigned right,
    const double switchProb)
{
    if (left == right) return log1m(switchProb);
    return std::log(switchProb);
}



CrossModel::
CrossModel(const CROSS_TYPE::index_t crossType)
    : _crossType(crossType)
{
    using namespace CROSS_TYPE;

    switch (_crossType)
    {
    case F2:
        _possibleGenotypes = { TrueGenotype(0,0), TrueGenotype(0,1), TrueGenotype(1,1) };
        return;
    case BC:
        _possibleGenotypes = { TrueGenotype(0,0), TrueGenotype(0,1) };
        return;
    case RISELF:
    case RISIB:
        _possibleGenotypes = { TrueGenotype(0,0), TrueGenotype(1,1) };
        return;
    case SIZE:
        break;
    }

    std::ostringstream oss;
    oss << "Can't create cross model for cross type index: " << static_cast<int>(crossType);
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}



unsigned
CrossModel::
getGenotypeIndex(const TrueGenotype& genotype) const
{
    const TrueGenotype aa(0,0);
    const TrueGenotype ab(0,1);
    const TrueGenotype bb(1,1);

    switch (_crossType)
    {
    case CROSS_TYPE::F2:
        if (genotype == aa) return F2_GT::AA;
        if ((genotype == ab) || (genotype.reversed() == ab)) return F2_GT::AB;
        if (genotype == bb) return F2_GT::BB;
        break;
    case CROSS_TYPE::BC:
        if (genotype == aa) return BC_GT::AA;
        if ((genotype == ab) || (genotype.reversed() == ab)) return BC_GT::AB;
        break;
    case CROSS_TYPE::RISELF:
    case CROSS_TYPE::RISIB:
        if (genotype == aa) return INBRED_GT::AA;
        if (genotype == bb) return INBRED_GT::BB;
        break;
    case CROSS_TYPE::SIZE:
        break;
    }

    throwIncompatibleGenotype(_crossType, genotype);
    return 0;
}



void
CrossModel::
checkGenotypeIndex(const unsigned genotypeIndex) const
{
    if (genotypeIndex < getGenotypeCount()) return;

    std::ostringstream oss;
    oss << "Genotype index " << genotypeIndex << " is out of range for cross type " << _crossType;
    BOOST_THROW_EXCEPTION(qtlmap::common::IncompatibleCrossException(oss.str()));
}



double
CrossModel::
init(const unsigned genotypeIndex) const
{
    checkGenotypeIndex(genotypeIndex);

    switch (_crossType)
    {
    case CROSS_TYPE::F2:
        if (genotypeIndex == F2_GT::AB) return -ln2;
        return -2.0*ln2;
    case CROSS_TYPE::BC:
    case CROSS_TYPE::RISELF:
    case CROSS_TYPE::RISIB:
        return -ln2;
    case CROSS_TYPE::SIZE:
        break;
    }

    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unhandled cross type in init"));
}



unsigned
CrossModel::
getCompatibleGenotypes(
    const GenotypeSymbolMapper& observed,
    std::vector<bool>& isCompatible) const
{
    isCompatible.assign(getGenotypeCount(), false);
    for (const TrueGenotype& genotype : observed.getGenotypes())
    {
        isCompatible[getGenotypeIndex(genotype)] = true;
    }

    unsigned compatibleCount(0);
    for (const bool val : isCompatible)
    {
        if (val) compatibleCount++;
    }
    return compatibleCount;
}



double
CrossModel::
emit(
    const GenotypeSymbolMapper& observed,
    const unsigned genotypeIndex,
    const double errorProb) const
{
    checkGenotypeIndex(genotypeIndex);

    if (observed.isMissing()) return 0.;

    std::vector<bool> isCompatible;
    const unsigned compatibleCount(getCompatibleGenotypes(observed, isCompatible));

    if (isCompatible[genotypeIndex])
    {
        return log1m(errorProb/compatibleCount);
    }
    else
    {
        const unsigned alternateCount(getGenotypeCount()-1);
        return std::log(errorProb) - std::log(static_cast<double>(alternateCount));
    }
}



void
CrossModel::
getEmissionLogProbs(
    const GenotypeSymbolMapper& observed,
    const double errorProb,
    std::vector<double>& emission) const
{
    const unsigned genotypeCount(getGenotypeCount());
    emission.resize(genotypeCount);
    for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
    {
        emission[genotypeIndex] = emit(observed, genotypeIndex, errorProb);
    }
}



double
CrossModel::
step(
    const unsigned leftGenotypeIndex,
    const unsigned rightGenotypeIndex,
    const double recFrac) const
{
    checkGenotypeIndex(leftGenotypeIndex);
    checkGenotypeIndex(rightGenotypeIndex);

    if ((recFrac < 0.) || (recFrac > 0.5) || std::isnan(recFrac))
    {
        std::ostringstream oss;
        oss << "Recombination fraction out of range [0,0.5]: " << recFrac;
        BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
    }

    switch (_crossType)
    {
    case CROSS_TYPE::F2:
        return stepF2(static_cast<F2_GT::index_t>(leftGenotypeIndex),
                      static_cast<F2_GT::index_t>(rightGenotypeIndex), recFrac);
    case CROSS_TYPE::BC:
        return stepTwoState(leftGenotypeIndex, rightGenotypeIndex, recFrac);
    case CROSS_TYPE::RISELF:
        // recombinant inbred by selfing: R = 2r/(1+2r)
        return stepTwoState(leftGenotypeIndex, rightGenotypeIndex, 2.0*recFrac/(1.0+2.0*recFrac));
    case CROSS_TYPE::RISIB:
        // recombinant inbred by sib mating: R = 4r/(1+6r)
        return stepTwoState(leftGenotypeIndex, rightGenotypeIndex, 4.0*recFrac/(1.0+6.0*recFrac));
    case CROSS_TYPE::SIZE:
        break;
    }

    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unhandled cross type in step"));
}



void
CrossModel::
getTransitionLogProbs(
    const double recFrac,
    std::vector<double>& transition) const
{
    const unsigned genotypeCount(getGenotypeCount());
    transition.resize(genotypeCount*genotypeCount);
    for (unsigned left(0); left<genotypeCount; ++left)
    {
        for (unsigned right(0); right<genotypeCount; ++right)
        {
            transition[left*genotypeCount+right] = step(left, right, recFrac);
        }
    }
}
