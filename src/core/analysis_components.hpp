// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef analysis_components_hpp
#define analysis_components_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "config/common.hpp"
#include "config/option_parser.hpp"
#include "io/reference/fasta_reader.hpp"
#include "core/comparison.hpp"

namespace polyscan {

class AnalysisComponents
{
public:
    using Path = boost::filesystem::path;
    
    AnalysisComponents() = delete;
    
    AnalysisComponents(io::FastaRecord reference, NucleotideSequence query, ComparisonOptions options,
                       boost::optional<Path> output = boost::none, unsigned line_width = 0);
    
    AnalysisComponents(const AnalysisComponents&)            = default;
    AnalysisComponents& operator=(const AnalysisComponents&) = default;
    AnalysisComponents(AnalysisComponents&&)                 = default;
    AnalysisComponents& operator=(AnalysisComponents&&)      = default;
    
    ~AnalysisComponents() = default;
    
    const std::string& reference_name() const noexcept;
    const NucleotideSequence& reference() const noexcept;
    const NucleotideSequence& query() const noexcept;
    const ComparisonOptions& comparison_options() const noexcept;
    const boost::optional<Path>& output() const noexcept;
    unsigned line_width() const noexcept;
    
private:
    io::FastaRecord reference_;
    NucleotideSequence query_;
    ComparisonOptions comparison_options_;
    boost::optional<Path> output_;
    unsigned line_width_;
};

AnalysisComponents collate_analysis_components(const options::OptionMap& options);

} // namespace polyscan

#endif
