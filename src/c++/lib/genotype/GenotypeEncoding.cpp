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

#include "genotype/GenotypeEncoding.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string.hpp"

#include <cerrno>

#include <fstream>
#include <sstream>



static
void
encodingError(
    const std::string& line,
    const char* reason)
{
    using namespace qtlmap::common;

    std::ostringstream oss;
    oss << "Malformed genotype encoding (" << reason << "): '" << line << "'";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
}



void
parseGenotypeEncoding(
    const std::string& line,
    GenotypeEncoding& encoding)
{
    encoding.names.clear();
    encoding.genotypes.clear();

    const std::string trimmed(boost::algorithm::trim_copy(line));
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    if (tokens.empty() || (tokens[0] != "GENOTYPE"))
    {
        encodingError(line, "expected GENOTYPE keyword");
    }

    unsigned tokenIndex(1);
    for (; tokenIndex<tokens.size(); ++tokenIndex)
    {
        if (tokens[tokenIndex] == "as") break;

        std::vector<std::string> names;
        boost::algorithm::split(names, tokens[tokenIndex], boost::algorithm::is_any_of(","));
        for (const std::string& name : names)
        {
            if (name.empty()) continue;
            encoding.names.push_back(name);
        }
    }

    if (tokenIndex >= tokens.size())
    {
        encodingError(line, "expected 'as'");
    }
    if (encoding.names.empty())
    {
        encodingError(line, "expected at least one symbol name");
    }

    for (++tokenIndex; tokenIndex<tokens.size(); ++tokenIndex)
    {
        const std::string& token(tokens[tokenIndex]);
        if ((token == "None") || (token[0] == '#')) break;

        TrueGenotype genotype(0,0);
        if (! TrueGenotype::parse(token, genotype))
        {
            encodingError(line, "malformed founder pair");
        }
        encoding.genotypes.push_back(genotype);
    }
}



GenotypeSymbolRef
addGenotypeEncoding(
    const std::string& line,
    ObservedGenotypeRegistry& registry)
{
    GenotypeEncoding encoding;
    parseGenotypeEncoding(line, encoding);
    return registry.add(GenotypeSymbolMapper(encoding.names, encoding.genotypes));
}



void
addGenotypeEncodings(
    const std::vector<std::string>& lines,
    ObservedGenotypeRegistry& registry)
{
    for (const std::string& line : lines)
    {
        const std::string trimmed(boost::algorithm::trim_copy(line));
        if (trimmed.empty() || (trimmed[0] == '#')) continue;
        addGenotypeEncoding(trimmed, registry);
    }
}



void
readGenotypeEncodingFile(
    const std::string& filename,
    ObservedGenotypeRegistry& registry)
{
    using namespace qtlmap::common;

    std::ifstream ifs(filename.c_str());
    if (! ifs)
    {
        std::ostringstream oss;
        oss << "Can't open genotype encoding file: '" << filename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()) << errinfo_dataset(filename));
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
    {
        lines.push_back(line);
    }

    try
    {
        addGenotypeEncodings(lines, registry);
    }
    catch (boost::exception& e)
    {
        e << errinfo_dataset(filename);
        throw;
    }
}
