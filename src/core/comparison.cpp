// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "comparison.hpp"

#include <ostream>

#include "core/tools/pairwise_aligner.hpp"
#include "core/tools/sequence_similarity.hpp"
#include "utils/sequence_utils.hpp"
#include "utils/timing.hpp"
#include "exceptions/invalid_sequence_error.hpp"
#include "logging/logging.hpp"

namespace polyscan {

namespace {

void validate_reference(const NucleotideSequence& reference)
{
    const auto bad_position = utils::find_non_canonical_base(reference);
    if (bad_position) {
        throw InvalidReferenceSequence {reference[*bad_position], *bad_position};
    }
}

void validate_query(const NucleotideSequence& query)
{
    const auto bad_position = utils::find_non_canonical_base(query);
    if (bad_position) {
        throw InvalidQuerySequence {query[*bad_position], *bad_position};
    }
}

void log_alignment(const char* name, const AlignedPair& alignment, const utils::TimeInterval& duration)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        stream(*debug_log) << name << " alignment of reference " << alignment.reference_region
                           << " and query " << alignment.query_region << " scored " << alignment.score
                           << " (" << make_cigar(alignment) << ") in " << duration
                           << ": " << count_identities(alignment) << " identities, "
                           << count_substitutions(alignment) << " substitutions, "
                           << count_gaps(alignment) << " gaps";
    }
}

void trace_comparison(const NucleotideSequence& reference, const NucleotideSequence& query,
                      const ComparisonOptions& options)
{
    auto trace_log = logging::get_trace_log();
    if (trace_log) {
        stream(*trace_log) << "Alignment matrices have " << (reference.size() + 1) << " x "
                           << (query.size() + 1) << " cells";
        const auto blocks = coretools::find_matching_blocks(reference, query, options.junk_policy);
        auto log = stream(*trace_log);
        log << "Matching blocks:";
        for (const auto& block : blocks) log << ' ' << block;
    }
}

} // namespace

ComparisonResult compare(const NucleotideSequence& reference, const NucleotideSequence& query,
                         const ComparisonOptions& options)
{
    validate_reference(reference);
    validate_query(query);
    trace_comparison(reference, query, options);
    ComparisonResult result {};
    utils::TimeInterval duration {};
    result.similarity = utils::time_call([&] () { return coretools::similarity(reference, query, options.junk_policy); }, duration);
    result.is_divergent = coretools::classify(result.similarity, options.threshold);
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        stream(*debug_log) << "Similarity " << result.similarity << "% computed in " << duration
                           << "; divergent at threshold " << options.threshold << ": " << std::boolalpha << result.is_divergent;
    }
    result.global_alignment = utils::time_call([&] () { return coretools::global_align(reference, query, options.scoring); }, duration);
    log_alignment("Global", result.global_alignment, duration);
    result.local_alignment = utils::time_call([&] () { return coretools::local_align(reference, query, options.scoring); }, duration);
    log_alignment("Local", result.local_alignment, duration);
    return result;
}

std::ostream& operator<<(std::ostream& os, const ComparisonResult& result)
{
    os << "similarity=" << result.similarity << "% divergent=" << std::boolalpha << result.is_divergent << std::noboolalpha
       << " global=" << result.global_alignment.score << " local=" << result.local_alignment.score;
    return os;
}

} // namespace polyscan
