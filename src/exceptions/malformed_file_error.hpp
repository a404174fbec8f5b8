// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef malformed_file_error_hpp
#define malformed_file_error_hpp

#include <string>

#include <boost/optional.hpp>

#include "user_error.hpp"
#include "file_error.hpp"

namespace polyscan {

/**
 A MalformedFileError is thrown when a file exists but its contents cannot be used, e.g. a reference
 with no sequence lines or with symbols other than A, C, G and T. The reason, if set, is appended
 to the explanation.
 */
class MalformedFileError : public FileError<UserError>
{
public:
    MalformedFileError(Path file);
    MalformedFileError(Path file, std::string kind);
    
    virtual ~MalformedFileError() override = default;
    
    void set_reason(std::string reason) noexcept;
    
    const boost::optional<std::string>& reason() const noexcept { return reason_; }
    
private:
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    boost::optional<std::string> reason_;
};

} // namespace polyscan

#endif
