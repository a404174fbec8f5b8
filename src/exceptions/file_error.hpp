// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef file_error_hpp
#define file_error_hpp

#include <string>
#include <sstream>
#include <utility>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

namespace polyscan {

/**
 FileError holds what every error about a user named file reports: the path, what kind of
 file it was meant to be (e.g. "fasta" or "report"), and where on the command line it was given.
 ErrorCategory is one of UserError or SystemError.
 */
template <typename ErrorCategory>
class FileError : public ErrorCategory
{
public:
    using Path = boost::filesystem::path;
    
    FileError() = delete;
    
    FileError(Path file, boost::optional<std::string> kind = boost::none)
    : file_ {std::move(file)}
    , kind_ {std::move(kind)}
    , location_ {}
    {}
    
    virtual ~FileError() override = default;
    
    const Path& file() const noexcept { return file_; }
    
    const boost::optional<std::string>& kind() const noexcept { return kind_; }
    
    void set_location_specified(std::string location) { location_ = std::move(location); }
    
protected:
    // e.g. the fasta file you specified "ref.fa" in the command line option --reference
    std::string describe_file() const
    {
        std::ostringstream ss {};
        ss << "the ";
        if (kind_) ss << *kind_ << ' ';
        ss << "file you specified " << file_;
        if (location_) ss << " in " << *location_;
        return ss.str();
    }
    
private:
    Path file_;
    boost::optional<std::string> kind_, location_;
};

} // namespace polyscan

#endif
