// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef program_error_hpp
#define program_error_hpp

#include <string>

#include "error.hpp"
#include "config/config.hpp"

namespace polyscan {

// A broken internal invariant, e.g. an alignment traceback that leaves the score matrix. Always a bug.
class ProgramError : public Error
{
    virtual std::string do_type() const override { return "program"; }
    virtual std::string do_help() const override
    {
        return "rerun with --debug and " + config::BugReport;
    }
public:
    virtual ~ProgramError() override = default;
};

} // namespace polyscan

#endif
