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

#include "cross/CrossType.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/case_conv.hpp"

#include <iostream>
#include <sstream>



namespace CROSS_TYPE
{

const char*
label(const index_t crossType)
{
    switch (crossType)
    {
    case BC:
        return "BC";
    case F2:
        return "F2";
    case RISELF:
        return "RISELF";
    case RISIB:
        return "RISIB";
    case SIZE:
        break;
    }

    std::ostringstream oss;
    oss << "Unknown cross type index: " << static_cast<int>(crossType);
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException(oss.str()));
}



index_t
parse(const std::string& str)
{
    const std::string upperStr(boost::algorithm::to_upper_copy(str));
    for (unsigned crossIndex(0); crossIndex<SIZE; ++crossIndex)
    {
        const index_t crossType(static_cast<index_t>(crossIndex));
        if (upperStr == label(crossType)) return crossType;
    }

    std::ostringstream oss;
    oss << "Unknown cross type: '" << str << "', expected one of: BC F2 RISELF RISIB";
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}

}



std::ostream&
operator<<(std::ostream& os, const CROSS_TYPE::index_t crossType)
{
    os << CROSS_TYPE::label(crossType);
    return os;
}
