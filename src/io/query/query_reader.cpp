// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "query_reader.hpp"

#include <istream>
#include <ostream>
#include <utility>

#include "io/reference/fasta_reader.hpp"
#include "utils/string_utils.hpp"

namespace polyscan { namespace io {

const std::string QueryPrompt {"Enter the DNA sequence to analyze: "};

NucleotideSequence normalise_query(std::string sequence)
{
    utils::trim(sequence);
    utils::capitalise(sequence);
    return sequence;
}

NucleotideSequence read_query(std::istream& in, std::ostream& prompt)
{
    prompt << QueryPrompt << std::flush;
    std::string line {};
    std::getline(in, line);
    return normalise_query(std::move(line));
}

NucleotideSequence read_query_file(const boost::filesystem::path& query_path)
{
    return read_fasta(query_path).sequence;
}

} // namespace io
} // namespace polyscan
