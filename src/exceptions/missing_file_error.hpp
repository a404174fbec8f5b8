// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_file_error_hpp
#define missing_file_error_hpp

#include <string>

#include "user_error.hpp"
#include "file_error.hpp"

namespace polyscan {

// Thrown when a reference or query path given by the user does not exist.
class MissingFileError : public FileError<UserError>
{
public:
    MissingFileError(Path file);
    MissingFileError(Path file, std::string kind);
    
    virtual ~MissingFileError() override = default;
    
private:
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
};

} // namespace polyscan

#endif
