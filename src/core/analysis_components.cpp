// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "analysis_components.hpp"

#include <utility>

#include "config/option_collation.hpp"
#include "logging/logging.hpp"
#include "utils/sequence_utils.hpp"
#include "utils/string_utils.hpp"

namespace polyscan {

AnalysisComponents::AnalysisComponents(io::FastaRecord reference, NucleotideSequence query, ComparisonOptions options,
                                       boost::optional<Path> output, const unsigned line_width)
: reference_ {std::move(reference)}
, query_ {std::move(query)}
, comparison_options_ {std::move(options)}
, output_ {std::move(output)}
, line_width_ {line_width}
{}

const std::string& AnalysisComponents::reference_name() const noexcept
{
    return reference_.name;
}

const NucleotideSequence& AnalysisComponents::reference() const noexcept
{
    return reference_.sequence;
}

const NucleotideSequence& AnalysisComponents::query() const noexcept
{
    return query_;
}

const ComparisonOptions& AnalysisComponents::comparison_options() const noexcept
{
    return comparison_options_;
}

const boost::optional<AnalysisComponents::Path>& AnalysisComponents::output() const noexcept
{
    return output_;
}

unsigned AnalysisComponents::line_width() const noexcept
{
    return line_width_;
}

namespace {

void log_reference(const io::FastaRecord& reference)
{
    logging::InfoLogger info_log {};
    auto log = stream(info_log);
    log << "Reference genome loaded successfully";
    if (!reference.name.empty()) {
        log << ": " << reference.name;
    }
    log << " (" << reference.sequence.size() << "bp, GC content "
        << utils::to_string(100 * utils::gc_content(reference.sequence)) << "%)";
}

} // namespace

AnalysisComponents collate_analysis_components(const options::OptionMap& options)
{
    auto comparison_options = options::make_comparison_options(options);
    auto reference = options::load_reference(options);
    log_reference(reference);
    auto query = options::get_query(options);
    logging::InfoLogger info_log {};
    stream(info_log) << "Query sequence has " << query.size() << " bases";
    return AnalysisComponents {std::move(reference), std::move(query), std::move(comparison_options),
                               options::get_output_path(options), options::get_line_width(options)};
}

} // namespace polyscan
