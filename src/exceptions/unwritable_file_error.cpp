// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "unwritable_file_error.hpp"

#include <utility>

namespace polyscan {

UnwritableFileError::UnwritableFileError(Path file) : FileError {std::move(file)} {}

UnwritableFileError::UnwritableFileError(Path file, std::string kind) : FileError {std::move(file), std::move(kind)} {}

std::string UnwritableFileError::do_where() const
{
    return "ReportWriter";
}

std::string UnwritableFileError::do_why() const
{
    return describe_file() + " could not be opened for writing";
}

std::string UnwritableFileError::do_help() const
{
    return "check the parent directory exists and that you have permission to write there";
}

} // namespace polyscan
