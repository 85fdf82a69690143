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

#include "common/OutStream.hh"
#include "common/Exceptions.hh"

#include <cerrno>

#include <iostream>
#include <sstream>



OutStream::
OutStream(const std::string& filename) :
    _filename(filename),
    _isStdout(filename == "-"),
    _stdoutStream(std::cout)
{
    using namespace qtlmap::common;

    if (_isStdout) return;

    _fileStream.open(_filename.c_str());
    if (! _fileStream)
    {
        std::ostringstream oss;
        oss << "Can't open output file: '" << _filename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }
}
