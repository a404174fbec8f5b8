// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>
#include <sstream>

#include "version.hpp"

namespace polyscan { namespace config {

namespace {

boost::optional<std::string> get_release_name()
{
    const std::string name {POLYSCAN_VERSION_RELEASE};
    if (name.empty()) return boost::none;
    return name;
}

} // namespace

const VersionNumber Version {POLYSCAN_VERSION_MAJOR, POLYSCAN_VERSION_MINOR, POLYSCAN_VERSION_PATCH, get_release_name()};

const BuildInfo Build {
    POLYSCAN_SYSTEM_PROCESSOR " " POLYSCAN_SYSTEM_NAME " " POLYSCAN_SYSTEM_VERSION,
    POLYSCAN_COMPILER_NAME " " POLYSCAN_COMPILER_VERSION,
    POLYSCAN_BOOST_VERSION,
    POLYSCAN_BUILD_TYPE
};

std::ostream& operator<<(std::ostream& os, const VersionNumber& version)
{
    os << version.major << '.' << version.minor;
    if (version.patch) os << '.' << *version.patch;
    if (version.name) os << '-' << *version.name;
    return os;
}

std::ostream& operator<<(std::ostream& os, const BuildInfo& build)
{
    os << "Target: " << build.target << '\n'
       << "Compiler: " << build.compiler << '\n'
       << "Boost: " << build.boost_version;
    if (!build.build_type.empty()) os << '\n' << "Build type: " << build.build_type;
    return os;
}

std::string to_string(const VersionNumber& version)
{
    std::ostringstream ss {};
    ss << version;
    return ss.str();
}

const std::string ProgramName {"polyscan"};

const std::string BugReport {"send the debug log, with the command you ran, to the polyscan maintainers"};

const std::string CopyrightNotice {"Copyright (c) 2015-2021 Daniel Cooke"};

const unsigned CommandLineWidth {72};

} // namespace config
} // namespace polyscan
