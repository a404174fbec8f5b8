// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include "config/config.hpp"
#include "config/common.hpp"

namespace polyscan {

std::string make_banner(const std::string& title, const std::size_t width)
{
    if (title.empty()) return std::string(width, '-');
    const auto padded_title = ' ' + title + ' ';
    if (padded_title.size() >= width) return title;
    const auto left = (width - padded_title.size()) / 2;
    return std::string(left, '-') + padded_title + std::string(width - left - padded_title.size(), '-');
}

void log_program_startup()
{
    logging::InfoLogger log {};
    log << make_banner(config::ProgramName + " v" + config::to_string(config::Version), config::CommandLineWidth);
    log << config::CopyrightNotice;
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Build\n" << config::Build;
}

void log_command_line_options(const options::OptionMap& options)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Program options:\n" << options::to_string(options);
}

void log_program_end()
{
    logging::InfoLogger log {};
    log << make_banner("", config::CommandLineWidth);
}

} // namespace polyscan
