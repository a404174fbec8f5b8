// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef unwritable_file_error_hpp
#define unwritable_file_error_hpp

#include <string>

#include "system_error.hpp"
#include "file_error.hpp"

namespace polyscan {

class UnwritableFileError : public FileError<SystemError>
{
public:
    UnwritableFileError(Path file);
    UnwritableFileError(Path file, std::string kind);
    
    virtual ~UnwritableFileError() override = default;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
};

} // namespace polyscan

#endif
