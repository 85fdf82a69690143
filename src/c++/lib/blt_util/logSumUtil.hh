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
/// \brief Various utilities for taking sums in log-space
///
/// All functions accept -inf terms (log of a zero probability), which are common in the HMM transition
/// kernels at zero recombination fraction.
///

#pragma once

#include "blt_util/math_util.hh"

#include <cmath>

#include <iterator>
#include <utility>


/// Returns the equivalent of log(exp(x_1)+exp(x_2)+....exp(x_n))
///
/// Returns -inf for an empty range or a range where every term is -inf.
///
template <typename IterType>
typename std::iterator_traits<IterType>::value_type
getLogSumSequence(
    IterType beginIter,
    IterType endIter)
{
    typedef typename std::iterator_traits<IterType>::value_type value_type;
    static_assert(std::is_floating_point<value_type>::value, "Requires iterator on floating point type.");

    static const value_type neginf(negativeInfinity<value_type>());

    if (beginIter == endIter) return neginf;

    IterType largest(beginIter);
    for (IterType iter(std::next(beginIter)); iter != endIter; ++iter)
    {
        if (*iter > *largest) largest = iter;
    }

    if (*largest == neginf) return neginf;

    value_type smallSum(0);
    for (; beginIter != endIter; ++beginIter)
    {
        if (beginIter == largest) continue;
        smallSum += std::exp(*beginIter - *largest);
    }

    return *largest + log1p_switch(smallSum);
}


/// Returns the equivalent of log(exp(x_1)+exp(x_2)+....exp(x_n)), where x_1..x_n are all elements in \p container
///
template <typename ContainerType>
auto
getLogSumSequence(
    const ContainerType& container) -> typename std::iterator_traits<decltype(std::begin(container))>::value_type
{
    return getLogSumSequence(std::begin(container), std::end(container));
}


/// Convert a sequence of unnormalized log-probabilities into normalized probabilities in place
///
/// \return the log of the normalization constant, -inf when every term is -inf (the output is then left as all
/// zeros and the caller must decide how to treat the impossible state)
///
template <typename IterType>
typename std::iterator_traits<IterType>::value_type
normalizeLogDistro(
    IterType beginIter,
    IterType endIter)
{
    typedef typename std::iterator_traits<IterType>::value_type value_type;

    const value_type logSum(getLogSumSequence(beginIter, endIter));
    const bool isZeroMass(std::isinf(logSum));
    for (; beginIter != endIter; ++beginIter)
    {
        *beginIter = (isZeroMass ? 0 : std::exp(*beginIter - logSum));
    }
    return logSum;
}
