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

#include "data/CrossCsvReader.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/case_conv.hpp"
#include "boost/algorithm/string/split.hpp"
#include "boost/algorithm/string/trim.hpp"
#include "boost/lexical_cast.hpp"

#include <cerrno>
#include <cmath>

#include <fstream>
#include <iostream>
#include <map>
#include <sstream>



using namespace qtlmap::common;



/// split one csv line into trimmed fields, double quotes around a field are removed
static
void
splitCsvLine(
    const std::string& line,
    std::vector<std::string>& fields)
{
    boost::algorithm::split(fields, line, [](const char c)
    {
        return (c == ',');
    });

    for (std::string& field : fields)
    {
        boost::algorithm::trim(field);
        if ((field.size() >= 2) && (field.front() == '"') && (field.back() == '"'))
        {
            field = field.substr(1, field.size()-2);
        }
    }
}



/// read the next non-empty line
///
/// \return false at end of input
static
bool
getNextLine(
    std::istream& is,
    std::string& line,
    unsigned& lineNumber)
{
    while (std::getline(is, line))
    {
        lineNumber++;
        if ((! line.empty()) && (line.back() == '\r')) line.pop_back();
        if (! boost::algorithm::trim_copy(line).empty()) return true;
    }
    return false;
}



static
void
checkFieldCount(
    const std::vector<std::string>& fields,
    const unsigned expectedCount)
{
    if (fields.size() == expectedCount) return;

    std::ostringstream oss;
    oss << "Found " << fields.size() << " fields, expected " << expectedCount;
    BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
}



static
bool
isSexChromosomeName(const std::string& name)
{
    return (boost::algorithm::to_upper_copy(name) == "X");
}



CrossData
readCrossCsv(
    std::istream& is,
    const std::string& datasetName,
    const ObservedGenotypeRegistry& registry)
{
    CrossData crossData;
    unsigned lineNumber(0);

    try
    {
        std::string line;
        std::vector<std::string> names;
        std::vector<std::string> chromosomeNames;
        std::vector<std::string> positions;

        if (! getNextLine(is, line, lineNumber))
        {
            BOOST_THROW_EXCEPTION(InvalidParameterException("Cross file has no header rows"));
        }
        splitCsvLine(line, names);
        const unsigned columnCount(names.size());

        if (! getNextLine(is, line, lineNumber))
        {
            BOOST_THROW_EXCEPTION(InvalidParameterException("Cross file has no chromosome row"));
        }
        splitCsvLine(line, chromosomeNames);
        checkFieldCount(chromosomeNames, columnCount);

        if (! getNextLine(is, line, lineNumber))
        {
            BOOST_THROW_EXCEPTION(InvalidParameterException("Cross file has no marker position row"));
        }
        splitCsvLine(line, positions);
        checkFieldCount(positions, columnCount);

        // classify columns and build the marker list:
        std::vector<bool> isPhenotypeColumn(columnCount);
        std::vector<std::string> phenotypeNames;
        std::vector<std::string> markerNames;
        std::map<std::string,ChromosomeRef> chromosomes;
        for (unsigned columnIndex(0); columnIndex<columnCount; ++columnIndex)
        {
            const std::string& chromosomeName(chromosomeNames[columnIndex]);
            isPhenotypeColumn[columnIndex] = chromosomeName.empty();
            if (isPhenotypeColumn[columnIndex])
            {
                phenotypeNames.push_back(names[columnIndex]);
                continue;
            }

            ChromosomeRef& chromosome(chromosomes[chromosomeName]);
            if (! chromosome)
            {
                chromosome = std::make_shared<const Chromosome>(chromosomeName, isSexChromosomeName(chromosomeName));
            }

            double position(0);
            try
            {
                position = boost::lexical_cast<double>(positions[columnIndex]);
            }
            catch (const boost::bad_lexical_cast&)
            {
                std::ostringstream oss;
                oss << "Can't parse position '" << positions[columnIndex] << "' of marker '"
                    << names[columnIndex] << "'";
                BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
            }

            if (! std::isfinite(position))
            {
                std::ostringstream oss;
                oss << "Position of marker '" << names[columnIndex] << "' is not finite: '"
                    << positions[columnIndex] << "'";
                BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
            }

            crossData.markers.push_back(Marker(names[columnIndex], chromosome, position,
                                             static_cast<int>(markerNames.size())));
            markerNames.push_back(names[columnIndex]);
        }

        if (phenotypeNames.empty())
        {
            BOOST_THROW_EXCEPTION(InvalidParameterException("Cross file has no phenotype columns"));
        }

        crossData.genotypes = GenotypeMatrix(markerNames);
        crossData.phenotypes = PhenotypeMatrix(phenotypeNames);

        std::vector<std::string> fields;
        std::vector<GenotypeSymbolRef> genotypeRow;
        std::vector<double> phenotypeRow;
        while (getNextLine(is, line, lineNumber))
        {
            splitCsvLine(line, fields);
            checkFieldCount(fields, columnCount);

            genotypeRow.clear();
            phenotypeRow.clear();
            for (unsigned columnIndex(0); columnIndex<columnCount; ++columnIndex)
            {
                if (isPhenotypeColumn[columnIndex])
                {
                    phenotypeRow.push_back(parsePhenotypeValue(fields[columnIndex]));
                }
                else
                {
                    try
                    {
                        genotypeRow.push_back(registry.decode(fields[columnIndex]));
                    }
                    catch (boost::exception& e)
                    {
                        e << errinfo_position(names[columnIndex]);
                        throw;
                    }
                }
            }
            crossData.genotypes.addIndividual(genotypeRow);
            crossData.phenotypes.addIndividual(phenotypeRow);
        }
    }
    catch (boost::exception& e)
    {
        e << errinfo_dataset(datasetName);
        if (lineNumber > 0) e << errinfo_line_number(lineNumber);
        throw;
    }

    return crossData;
}



CrossData
readCrossCsv(
    const std::string& filename,
    const ObservedGenotypeRegistry& registry)
{
    std::ifstream ifs(filename.c_str());
    if (! ifs)
    {
        std::ostringstream oss;
        oss << "Can't open cross file: '" << filename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()) << errinfo_dataset(filename));
    }
    return readCrossCsv(ifs, filename, registry);
}
