// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <string>
#include <sstream>
#include <utility>

#include <boost/filesystem/operations.hpp>

#include "exceptions/user_error.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "io/query/query_reader.hpp"
#include "logging/logging.hpp"

namespace polyscan { namespace options {

namespace {

bool is_set(const std::string& option, const OptionMap& options) noexcept
{
    return options.count(option) == 1;
}

} // namespace

bool is_run_command(const OptionMap& options)
{
    return !is_set("help", options) && !is_set("version", options);
}

bool is_debug_mode(const OptionMap& options)
{
    return is_set("debug", options);
}

bool is_trace_mode(const OptionMap& options)
{
    return is_set("trace", options);
}

namespace {

class InvalidWorkingDirectory : public UserError
{
    std::string do_where() const override
    {
        return "get_working_directory";
    }
    
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "The working directory you specified ";
        ss << path_;
        ss << " does not exist";
        return ss.str();
    }
    
    std::string do_help() const override
    {
        return "enter a valid working directory";
    }
    
    fs::path path_;
public:
    InvalidWorkingDirectory(fs::path p) : path_ {std::move(p)} {}
};

} // namespace

fs::path get_working_directory(const OptionMap& options)
{
    if (is_set("working-directory", options)) {
        auto result = expand_user_path(options.at("working-directory").as<fs::path>());
        if (!fs::is_directory(result)) {
            throw InvalidWorkingDirectory {result};
        }
        return result;
    }
    return fs::current_path();
}

fs::path resolve_path(const fs::path& path, const OptionMap& options)
{
    return ::polyscan::resolve_path(path, get_working_directory(options));
}

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    if (is_debug_mode(options)) {
        return resolve_path(options.at("debug").as<fs::path>(), options);
    } else {
        return boost::none;
    }
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    if (is_trace_mode(options)) {
        return resolve_path(options.at("trace").as<fs::path>(), options);
    } else {
        return boost::none;
    }
}

ScoringScheme make_scoring_scheme(const OptionMap& options)
{
    ScoringScheme result {};
    result.match_score    = options.at("match-score").as<double>();
    result.mismatch_score = options.at("mismatch-score").as<double>();
    result.gap_open_score = options.at("gap-open-score").as<double>();
    if (is_set("gap-extend-score", options)) {
        result.gap_extend_score = options.at("gap-extend-score").as<double>();
    } else {
        result.gap_extend_score = result.gap_open_score;
    }
    if (result.gap_open_score > 0 || result.gap_extend_score > 0) {
        logging::WarningLogger warn_log {};
        stream(warn_log) << "Positive gap scores (" << result
                         << ") reward gaps, so alignments may contain many more gaps than expected";
    }
    return result;
}

double get_threshold(const OptionMap& options)
{
    return options.at("threshold").as<double>();
}

coretools::AutoJunkPolicy get_junk_policy(const OptionMap& options)
{
    if (options.at("autojunk").as<bool>()) {
        return coretools::AutoJunkPolicy::popular_symbols;
    }
    return coretools::AutoJunkPolicy::none;
}

ComparisonOptions make_comparison_options(const OptionMap& options)
{
    ComparisonOptions result {};
    result.scoring = make_scoring_scheme(options);
    result.threshold = get_threshold(options);
    result.junk_policy = get_junk_policy(options);
    return result;
}

io::FastaRecord load_reference(const OptionMap& options)
{
    const fs::path input_path {options.at("reference").as<fs::path>()};
    auto resolved_path = resolve_path(input_path, options);
    try {
        return io::read_reference(resolved_path);
    } catch (MissingFileError& e) {
        e.set_location_specified("the command line option --reference");
        throw;
    } catch (MalformedFileError& e) {
        e.set_location_specified("the command line option --reference");
        throw;
    }
}

NucleotideSequence get_query(const OptionMap& options, std::istream& in, std::ostream& prompt)
{
    if (is_set("query", options)) {
        return io::normalise_query(options.at("query").as<std::string>());
    }
    if (is_set("query-file", options)) {
        const auto resolved_path = resolve_path(options.at("query-file").as<fs::path>(), options);
        try {
            return io::read_query_file(resolved_path);
        } catch (MissingFileError& e) {
            e.set_location_specified("the command line option --query-file");
            throw;
        }
    }
    return io::read_query(in, prompt);
}

boost::optional<fs::path> get_output_path(const OptionMap& options)
{
    if (is_set("output", options)) {
        return resolve_path(options.at("output").as<fs::path>(), options);
    }
    return boost::none;
}

unsigned get_line_width(const OptionMap& options)
{
    return static_cast<unsigned>(options.at("line-width").as<int>());
}

} // namespace options
} // namespace polyscan
