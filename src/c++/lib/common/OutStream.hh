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
/// \brief output stream which writes to a file or to stdout
///

#pragma once

#include "boost/utility.hpp"

#include <fstream>
#include <iosfwd>
#include <string>


/// owns the output file stream when a filename is given, "-" selects stdout
///
/// the file is opened on construction so that permission problems surface before any long computation
///
struct OutStream : private boost::noncopyable
{
    explicit
    OutStream(const std::string& filename);

    std::ostream&
    getStream()
    {
        return (_isStdout ? _stdoutStream : _fileStream);
    }

    const std::string&
    getFilename() const
    {
        return _filename;
    }

private:
    const std::string _filename;
    const bool _isStdout;
    std::ofstream _fileStream;
    std::ostream& _stdoutStream;
};
