// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_file_error.hpp"

#include <utility>

namespace polyscan {

MalformedFileError::MalformedFileError(Path file) : FileError {std::move(file)}, reason_ {} {}

MalformedFileError::MalformedFileError(Path file, std::string kind)
: FileError {std::move(file), std::move(kind)}
, reason_ {}
{}

void MalformedFileError::set_reason(std::string reason) noexcept
{
    reason_ = std::move(reason);
}

std::string MalformedFileError::do_why() const
{
    auto result = describe_file() + " is malformed";
    if (reason_) result += ": " + *reason_;
    return result;
}

std::string MalformedFileError::do_help() const
{
    return "the file should hold one DNA sequence (A, C, G and T only), optionally after '>' header lines";
}

} // namespace polyscan
