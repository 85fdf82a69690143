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
/// \brief small numerical helpers shared by the log-space probability code
///

#pragma once

#include <cmath>

#include <limits>
#include <type_traits>


/// log(1+x), switching to the plain log expression where the argument is large enough that log1p offers no
/// extra precision
///
template <typename FloatType>
FloatType
log1p_switch(const FloatType x)
{
    static_assert(std::is_floating_point<FloatType>::value, "Requires floating point type.");

    static const FloatType smallx_thresh(0.01);

    if (std::abs(x)<smallx_thresh)
    {
        return std::log1p(x);
    }
    else
    {
        return std::log(1+x);
    }
}


/// log(1-x) for probability x in [0,1]
template <typename FloatType>
FloatType
log1m(const FloatType x)
{
    return log1p_switch(-x);
}


template <typename FloatType>
FloatType
negativeInfinity()
{
    static_assert(std::is_floating_point<FloatType>::value, "Requires floating point type.");
    return -std::numeric_limits<FloatType>::infinity();
}

