// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef system_error_hpp
#define system_error_hpp

#include <string>

#include "error.hpp"

namespace polyscan {

// The environment failed us: a file that cannot be opened, or memory ran out.
class SystemError : public Error
{
    virtual std::string do_type() const override { return "system"; }
public:
    virtual ~SystemError() override = default;
};

} // namespace polyscan

#endif
