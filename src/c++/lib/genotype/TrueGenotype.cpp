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

#include "genotype/TrueGenotype.hh"

#include "boost/algorithm/string.hpp"
#include "boost/lexical_cast.hpp"

#include <iostream>
#include <sstream>
#include <vector>



static
bool
isFounderIndexString(const std::string& str)
{
    if (str.empty()) return false;
    for (const char c : str)
    {
        if ((c < '0') || (c > '9')) return false;
    }
    return true;
}



std::string
TrueGenotype::
toString() const
{
    std::ostringstream oss;
    oss << _founder1 << ',' << _founder2;
    return oss.str();
}



bool
TrueGenotype::
parse(
    const std::string& str,
    TrueGenotype& result)
{
    const std::string trimmed(boost::algorithm::trim_copy(str));

    std::vector<std::string> fields;
    boost::algorithm::split(fields, trimmed, boost::algorithm::is_any_of(","));
    if (fields.size() != 2) return false;

    for (std::string& field : fields)
    {
        boost::algorithm::trim(field);
        if (! isFounderIndexString(field)) return false;
    }

    try
    {
        result = TrueGenotype(boost::lexical_cast<FounderIndex>(fields[0]),
                              boost::lexical_cast<FounderIndex>(fields[1]));
    }
    catch (const boost::bad_lexical_cast&)
    {
        // out of range for FounderIndex
        return false;
    }
    return true;
}



std::ostream&
operator<<(std::ostream& os, const TrueGenotype& genotype)
{
    os << '(' << genotype.getFirst() << ',' << genotype.getSecond() << ')';
    return os;
}
