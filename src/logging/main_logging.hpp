// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include <string>
#include <cstddef>

#include "logging.hpp"
#include "config/option_parser.hpp"

namespace polyscan {

// title centred in a line of width dashes, or just the dashes if title is empty.
std::string make_banner(const std::string& title, std::size_t width);

void log_program_startup();

void log_command_line_options(const options::OptionMap& options);

void log_program_end();
    
} // namespace polyscan

#endif
