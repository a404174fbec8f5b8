// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef config_hpp
#define config_hpp

#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

namespace polyscan { namespace config {

struct VersionNumber
{
    unsigned short major, minor;
    boost::optional<unsigned short> patch = boost::none;
    boost::optional<std::string> name = boost::none;
};

// Where and how this binary was built, as recorded by CMake.
struct BuildInfo
{
    std::string target, compiler, boost_version, build_type;
};

extern const VersionNumber Version;
extern const BuildInfo Build;

std::ostream& operator<<(std::ostream& os, const VersionNumber& version);
std::ostream& operator<<(std::ostream& os, const BuildInfo& build);

std::string to_string(const VersionNumber& version);

extern const std::string ProgramName;
extern const std::string BugReport;
extern const std::string CopyrightNotice;

// Banners and error paragraphs are wrapped to this many columns
extern const unsigned CommandLineWidth;

} // namespace config
} // namespace polyscan

#endif
