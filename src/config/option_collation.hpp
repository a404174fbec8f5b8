// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <iostream>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "common.hpp"
#include "option_parser.hpp"
#include "basics/scoring_scheme.hpp"
#include "core/comparison.hpp"
#include "core/tools/sequence_similarity.hpp"
#include "io/reference/fasta_reader.hpp"
#include "utils/path_utils.hpp"

namespace polyscan { namespace options {

bool is_run_command(const OptionMap& options);

bool is_debug_mode(const OptionMap& options);
bool is_trace_mode(const OptionMap& options);

fs::path get_working_directory(const OptionMap& options);

fs::path resolve_path(const fs::path& path, const OptionMap& options);

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options);

ScoringScheme make_scoring_scheme(const OptionMap& options);

double get_threshold(const OptionMap& options);

coretools::AutoJunkPolicy get_junk_policy(const OptionMap& options);

ComparisonOptions make_comparison_options(const OptionMap& options);

io::FastaRecord load_reference(const OptionMap& options);

// Prompts on prompt and reads from in if the query is not given on the command line.
NucleotideSequence get_query(const OptionMap& options, std::istream& in = std::cin, std::ostream& prompt = std::cout);

boost::optional<fs::path> get_output_path(const OptionMap& options);

unsigned get_line_width(const OptionMap& options);

} // namespace options
} // namespace polyscan

#endif
