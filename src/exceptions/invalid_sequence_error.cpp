// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "invalid_sequence_error.hpp"

#include <utility>
#include <sstream>
#include <cctype>

namespace polyscan {

InvalidSequenceError::InvalidSequenceError(std::string sequence_name, const char symbol, const std::size_t position)
: sequence_name_ {std::move(sequence_name)}
, symbol_ {symbol}
, position_ {position}
{}

std::string InvalidSequenceError::do_where() const
{
    return "validate_sequence";
}

std::string InvalidSequenceError::do_why() const
{
    std::ostringstream ss {};
    ss << "the " << sequence_name_ << " sequence contains the symbol ";
    if (std::isprint(static_cast<unsigned char>(symbol_))) {
        ss << '\'' << symbol_ << '\'';
    } else {
        ss << "with code " << static_cast<int>(static_cast<unsigned char>(symbol_));
    }
    ss << " at position " << (position_ + 1) << ", but only A, C, G and T are allowed";
    return ss.str();
}

std::string InvalidSequenceError::do_help() const
{
    return "remove any ambiguity codes, gaps or other symbols from the " + sequence_name_ + " sequence";
}

InvalidQuerySequence::InvalidQuerySequence(const char symbol, const std::size_t position)
: InvalidSequenceError {"query", symbol, position}
{}

InvalidReferenceSequence::InvalidReferenceSequence(const char symbol, const std::size_t position)
: InvalidSequenceError {"reference", symbol, position}
{}

} // namespace polyscan
