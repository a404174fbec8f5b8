// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef report_writer_hpp
#define report_writer_hpp

#include <string>
#include <iosfwd>
#include <fstream>
#include <memory>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "basics/aligned_pair.hpp"
#include "core/comparison.hpp"

namespace polyscan { namespace io {

enum class AlignmentStyle { global, local };

/*
    Three lines per block: the aligned reference, a markup line ('|' identity, '.' substitution,
    ' ' gap) and the aligned query, then "  Score=<score>". Local alignment sequence lines are prefixed
    with the 1-based position of their first base. A non-zero line_width splits the lines into blocks of
    at most line_width columns.
*/
std::string format_alignment(const AlignedPair& alignment, AlignmentStyle style, unsigned line_width = 0);

void write_report(std::ostream& os, const ComparisonResult& result, unsigned line_width = 0);

class ReportWriter
{
public:
    using Path = boost::filesystem::path;
    
    ReportWriter() = delete;
    
    // Writes to os, which must outlive the writer
    ReportWriter(std::ostream& os, unsigned line_width = 0);
    // Throws UnwritableFileError if file cannot be opened for writing
    ReportWriter(Path file, unsigned line_width = 0);
    
    ReportWriter(const ReportWriter&)            = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;
    ReportWriter(ReportWriter&&)                 = default;
    ReportWriter& operator=(ReportWriter&&)      = default;
    
    ~ReportWriter() = default;
    
    const boost::optional<Path>& path() const noexcept;
    
    void write(const ComparisonResult& result);
    
private:
    boost::optional<Path> path_;
    std::unique_ptr<std::ofstream> file_;
    std::ostream* os_;
    unsigned line_width_;
};

} // namespace io
} // namespace polyscan

#endif
