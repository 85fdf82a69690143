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

#include "common/Program.hh"
#include "common/Exceptions.hh"
#include "common/config.h"

#include "blt_util/log.hh"

#include "boost/exception/diagnostic_information.hpp"

#include <cstdlib>

#include <iostream>
#include <sstream>



static
std::string
cmdlineString(
    int argc,
    char* argv[])
{
    std::ostringstream oss;
    for (int i(0); i<argc; ++i)
    {
        if (i) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}



namespace qtlmap
{

const char*
Program::
version() const
{
    return QTLMAP_VERSION;
}



const char*
Program::
compiler() const
{
    static const std::string compilerName(std::string(QTLMAP_CXX_COMPILER_NAME) + "-" + QTLMAP_CXX_COMPILER_VERSION);
    return compilerName.c_str();
}



const char*
Program::
buildTime() const
{
    return QTLMAP_BUILD_TIME;
}



void
Program::
post_catch(
    int argc,
    char* argv[]) const
{
    log_os << "...caught in program.run()\n"
           << "\tcmdline:\t" << cmdlineString(argc,argv) << "\n"
           << "\tversion:\t" << version() << "\n"
           << "\tbuildTime:\t" << buildTime() << "\n"
           << "\tcompiler:\t" << compiler() << "\n";
}



int
Program::
run(int argc, char* argv[]) const
{
    try
    {
        std::ios_base::sync_with_stdio(false);

        runInternal(argc,argv);
    }
    catch (const qtlmap::common::ExceptionData& e)
    {
        log_os << "ERROR: " << name() << " exception: " << e.getContext() << "\n";
        post_catch(argc,argv);
        return EXIT_FAILURE;
    }
    catch (const boost::exception& e)
    {
        log_os << "ERROR: " << name() << " exception: " << boost::diagnostic_information(e) << "\n";
        post_catch(argc,argv);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        log_os << "ERROR: " << name() << " exception: " << e.what() << "\n";
        post_catch(argc,argv);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}
