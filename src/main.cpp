// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <iostream>
#include <cstdlib>
#include <exception>
#include <new>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "config/common.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "core/polyscan.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"
#include "exceptions/error.hpp"
#include "logging/error_handler.hpp"

using namespace polyscan;
using namespace polyscan::options;

namespace {

template <typename E>
auto log_exception(const E& e)
{
    log_error(e);
    log_program_end();
    return EXIT_FAILURE;
}

template <typename E>
auto log_startup_exception(const E& e)
{
    logging::init();
    log_program_startup();
    return log_exception(e);
}

void init_common(const OptionMap& options)
{
    logging::init(get_debug_log_file_name(options), get_trace_log_file_name(options));
    DEBUG_MODE = options::is_debug_mode(options);
    TRACE_MODE = options::is_trace_mode(options);
}

std::string to_string(const int argc, const char** argv)
{
    std::vector<std::string> arguments {argv, argv + argc};
    return utils::join(arguments, ' ');
}

} // namespace

int main(const int argc, const char** argv)
{
    OptionMap options;
    try {
        options = parse_options(argc, argv);
    } catch (const Error& e) {
        return log_startup_exception(e);
    } catch (const std::exception& e) {
        return log_startup_exception(e);
    } catch (...) {
        logging::init();
        log_unknown_error();
        log_program_end();
        return EXIT_FAILURE;
    }
    if (is_run_command(options)) {
        try {
            init_common(options);
            log_program_startup();
            logging::InfoLogger info_log {};
            auto debug_log = logging::get_debug_log();
            if (debug_log) stream(*debug_log) << "Command: " << to_string(argc, argv);
            log_command_line_options(options);
            const auto start = utils::now();
            const auto components = collate_analysis_components(options);
            run_polyscan(components);
            const auto end = utils::now();
            using utils::TimeInterval;
            stream(info_log) << "Finished in " << TimeInterval {start, end};
            log_program_end();
        } catch (const Error& e) {
            return log_exception(e);
        } catch (const std::bad_alloc& e) {
            return log_exception(e);
        } catch (const std::exception& e) {
            return log_exception(e);
        } catch (...) {
            log_unknown_error();
            log_program_end();
            return EXIT_FAILURE;
        }
    }
    return EXIT_SUCCESS;
}
