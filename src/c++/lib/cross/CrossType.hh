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
/// \brief the closed set of supported experimental cross designs
///

#pragma once

#include <iosfwd>
#include <string>


namespace CROSS_TYPE
{
enum index_t
{
    BC,
    F2,
    RISELF,
    RISIB,
    SIZE
};

const char*
label(const index_t crossType);

/// parse a cross type label, case insensitive
///
/// throws InvalidParameterException for unknown labels
index_t
parse(const std::string& str);
}


std::ostream&
operator<<(std::ostream& os, const CROSS_TYPE::index_t crossType);
