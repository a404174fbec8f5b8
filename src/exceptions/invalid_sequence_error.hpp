// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef invalid_sequence_error_hpp
#define invalid_sequence_error_hpp

#include <string>
#include <cstddef>

#include "user_error.hpp"

namespace polyscan {

/**
 An InvalidSequenceError should be thrown when a sequence supplied by the user contains a symbol
 other than A, C, G or T.
 */
class InvalidSequenceError : public UserError
{
public:
    InvalidSequenceError() = delete;
    
    InvalidSequenceError(std::string sequence_name, char symbol, std::size_t position);
    
    virtual ~InvalidSequenceError() override = default;
    
    const std::string& sequence_name() const noexcept { return sequence_name_; }
    char symbol() const noexcept { return symbol_; }
    std::size_t position() const noexcept { return position_; }
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string sequence_name_;
    char symbol_;
    std::size_t position_;
};

class InvalidQuerySequence : public InvalidSequenceError
{
public:
    InvalidQuerySequence(char symbol, std::size_t position);
};

class InvalidReferenceSequence : public InvalidSequenceError
{
public:
    InvalidReferenceSequence(char symbol, std::size_t position);
};

} // namespace polyscan

#endif
