// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "polyscan.hpp"

#include <iostream>

#include "config/common.hpp"
#include "core/comparison.hpp"
#include "io/report/report_writer.hpp"
#include "logging/logging.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"

namespace polyscan {

namespace {

io::ReportWriter make_report_writer(const AnalysisComponents& components)
{
    if (components.output()) {
        return io::ReportWriter {*components.output(), components.line_width()};
    }
    return io::ReportWriter {std::cout, components.line_width()};
}

void log_result(const ComparisonResult& result, const utils::TimeInterval& duration)
{
    logging::InfoLogger info_log {};
    stream(info_log) << "Compared sequences in " << duration << ": similarity "
                     << utils::to_string(result.similarity) << "%, "
                     << (result.is_divergent ? "infected" : "not infected");
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Comparison result " << result;
}

} // namespace

void run_polyscan(const AnalysisComponents& components)
{
    // An unwritable output path should fail before any alignment is done
    auto writer = make_report_writer(components);
    logging::InfoLogger info_log {};
    if (components.reference_name().empty()) {
        info_log << "Comparing query against reference";
    } else {
        stream(info_log) << "Comparing query against reference " << components.reference_name();
    }
    utils::TimeInterval duration {};
    const auto result = utils::time_call([&] () {
        return compare(components.reference(), components.query(), components.comparison_options());
    }, duration);
    log_result(result, duration);
    writer.write(result);
    if (writer.path()) {
        stream(info_log) << "Wrote report to " << *writer.path();
    }
}

} // namespace polyscan
