// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "path_utils.hpp"

#include <cstdlib>
#include <string>
#include <sstream>

#include <boost/filesystem/operations.hpp>

#include "exceptions/system_error.hpp"

namespace polyscan {

boost::optional<fs::path> get_home_directory()
{
    const auto env = std::getenv("HOME");
    if (env == nullptr) return boost::none;
    const fs::path home {env};
    if (fs::is_directory(home)) return home;
    return boost::none;
}

bool is_shorthand_user_path(const fs::path& path) noexcept
{
    return !path.empty() && path.string().front() == '~';
}

class UnknownHomeDirectory : public SystemError
{
    std::string do_where() const override
    {
        return "expand_user_path";
    }

    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "Unable to expand shorthand path you specified ";
        ss << path_;
        ss << " as your home directory cannot be located";
        return ss.str();
    }

    std::string do_help() const override
    {
        return "ensure your HOME environment variable is set properly";
    }

    fs::path path_;
public:
    UnknownHomeDirectory(fs::path p) : path_ {std::move(p)} {}
};

fs::path expand_user_path(const fs::path& path)
{
    if (is_shorthand_user_path(path) && path.string().size() > 1 && path.string()[1] == '/') {
        const auto home_dir = get_home_directory();
        if (home_dir) {
            return fs::path {home_dir->string() + path.string().substr(1)};
        }
        throw UnknownHomeDirectory {path};
    }
    return path;
}

fs::path resolve_path(const fs::path& path, const fs::path& working_directory)
{
    if (is_shorthand_user_path(path)) {
        return fs::absolute(expand_user_path(path));
    }
    if (path.is_absolute()) return path;
    const auto wd_full_path = working_directory / path;
    if (!fs::exists(wd_full_path) && fs::exists(path)) {
        return fs::absolute(path);
    }
    return fs::absolute(wd_full_path);
}

} // namespace polyscan
