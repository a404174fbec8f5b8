// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_file_error.hpp"

#include <utility>

namespace polyscan {

MissingFileError::MissingFileError(Path file) : FileError {std::move(file)} {}

MissingFileError::MissingFileError(Path file, std::string kind) : FileError {std::move(file), std::move(kind)} {}

std::string MissingFileError::do_why() const
{
    return describe_file() + " does not exist";
}

std::string MissingFileError::do_help() const
{
    if (kind()) {
        return "check the path to the " + *kind() + " file, or set --working-directory if the path is relative";
    }
    return "check the path, or set --working-directory if the path is relative";
}

} // namespace polyscan
