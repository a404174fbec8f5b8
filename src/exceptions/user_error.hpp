// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef user_error_hpp
#define user_error_hpp

#include <string>

#include "error.hpp"

namespace polyscan {

// Bad input: command line values, reference and query files, or the query sequence itself.
class UserError : public Error
{
    virtual std::string do_type() const override { return "user"; }
public:
    virtual ~UserError() override = default;
};

} // namespace polyscan

#endif
