// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "report_writer.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <utility>

#include "utils/string_utils.hpp"
#include "exceptions/unwritable_file_error.hpp"

namespace polyscan { namespace io {

namespace {

char markup(const char ref, const char query) noexcept
{
    if (ref == query) return '|';
    if (ref == AlignedPair::gap_symbol || query == AlignedPair::gap_symbol) return ' ';
    return '.';
}

std::string make_markup(const AlignedPair& alignment)
{
    std::string result(alignment_length(alignment), ' ');
    std::transform(std::cbegin(alignment.aligned_reference), std::cend(alignment.aligned_reference),
                   std::cbegin(alignment.aligned_query), std::begin(result), markup);
    return result;
}

std::size_t count_bases(const std::string& aligned_sequence, const std::size_t first, const std::size_t last) noexcept
{
    return std::count_if(std::next(std::cbegin(aligned_sequence), first), std::next(std::cbegin(aligned_sequence), last),
                         [] (const char c) { return c != AlignedPair::gap_symbol; });
}

std::string pad(std::string str, const std::size_t width)
{
    if (str.size() < width) str.resize(width, ' ');
    return str;
}

} // namespace

std::string format_alignment(const AlignedPair& alignment, const AlignmentStyle style, const unsigned line_width)
{
    const auto length = alignment_length(alignment);
    const auto markup_line = make_markup(alignment);
    const std::size_t chunk_size {line_width > 0 ? line_width : std::max(length, std::size_t {1})};
    auto reference_position = alignment.reference_region.begin() + 1;
    auto query_position = alignment.query_region.begin() + 1;
    std::ostringstream ss {};
    std::size_t chunk_begin {0};
    do {
        const auto chunk_end = std::min(chunk_begin + chunk_size, length);
        const auto chunk_length = chunk_end - chunk_begin;
        std::string reference_prefix {}, query_prefix {};
        if (style == AlignmentStyle::local) {
            reference_prefix = std::to_string(reference_position) + ' ';
            query_prefix = std::to_string(query_position) + ' ';
        }
        const auto prefix_width = std::max(reference_prefix.size(), query_prefix.size());
        ss << pad(reference_prefix, prefix_width) << alignment.aligned_reference.substr(chunk_begin, chunk_length) << '\n'
           << std::string(prefix_width, ' ') << markup_line.substr(chunk_begin, chunk_length) << '\n'
           << pad(query_prefix, prefix_width) << alignment.aligned_query.substr(chunk_begin, chunk_length) << '\n';
        reference_position += count_bases(alignment.aligned_reference, chunk_begin, chunk_end);
        query_position += count_bases(alignment.aligned_query, chunk_begin, chunk_end);
        chunk_begin = chunk_end;
    } while (chunk_begin < length);
    ss << "  Score=" << alignment.score << '\n';
    return ss.str();
}

void write_report(std::ostream& os, const ComparisonResult& result, const unsigned line_width)
{
    os << "Analysis Results:\n";
    os << "Similarity with reference genome: " << utils::to_string(result.similarity) << "%\n";
    if (result.is_divergent) {
        os << "Status: Infected (Significant variation detected)\n";
    } else {
        os << "Status: Not Infected (Sequence matches reference genome closely)\n";
    }
    os << "\nGlobal Alignment (Needleman-Wunsch):\n";
    os << format_alignment(result.global_alignment, AlignmentStyle::global, line_width) << '\n';
    os << "Global Alignment Score: " << utils::to_string(result.global_alignment.score) << '\n';
    os << "\nLocal Alignment (Smith-Waterman):\n";
    os << format_alignment(result.local_alignment, AlignmentStyle::local, line_width) << '\n';
    os << "Local Alignment Score: " << utils::to_string(result.local_alignment.score) << '\n';
}

ReportWriter::ReportWriter(std::ostream& os, const unsigned line_width)
: path_ {}
, file_ {}
, os_ {std::addressof(os)}
, line_width_ {line_width}
{}

ReportWriter::ReportWriter(Path file, const unsigned line_width)
: path_ {std::move(file)}
, file_ {std::make_unique<std::ofstream>(path_->string())}
, os_ {file_.get()}
, line_width_ {line_width}
{
    if (!*file_) {
        throw UnwritableFileError {*path_, "report"};
    }
}

const boost::optional<ReportWriter::Path>& ReportWriter::path() const noexcept
{
    return path_;
}

void ReportWriter::write(const ComparisonResult& result)
{
    write_report(*os_, result, line_width_);
    os_->flush();
}

} // namespace io
} // namespace polyscan
