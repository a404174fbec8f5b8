// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef error_hpp
#define error_hpp

#include <exception>
#include <string>
#include <iosfwd>

namespace polyscan {

/**
 Base of every exception polyscan throws. Each error answers four questions for the user, and the
 error handler prints the answers as separate paragraphs:
 
 - type: whose fault it is ("user", "system" or "program")
 - where: the component that detected it
 - why: a sentence explaining what went wrong
 - help: what the user can do about it
 */
class Error : public std::exception
{
public:
    virtual ~Error() override = default;
    
    std::string type() const;
    std::string where() const;
    std::string why() const;
    std::string help() const;
    
    // "<type> error in <where>: <why>"
    const char* what() const noexcept override;
    
private:
    virtual std::string do_type() const  = 0;
    virtual std::string do_where() const = 0;
    virtual std::string do_why() const   = 0;
    virtual std::string do_help() const  = 0;
    
    mutable std::string what_;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace polyscan

#endif
