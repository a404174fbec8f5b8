// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef fasta_reader_hpp
#define fasta_reader_hpp

#include <string>
#include <vector>
#include <iosfwd>

#include <boost/filesystem/path.hpp>

#include "config/common.hpp"

namespace polyscan { namespace io {

/*
    A single sequence read from a FASTA-like file: header lines (starting with '>') are skipped, all other
    lines are joined with whitespace removed and bases capitalised. name is the text of the first header,
    if there is one.
*/
struct FastaRecord
{
    std::string name;
    NucleotideSequence sequence;
};

FastaRecord read_fasta(std::istream& in);

// Throws MissingFileError if the file does not exist.
FastaRecord read_fasta(const boost::filesystem::path& fasta_path);

// As read_fasta, but throws MalformedFileError unless the file has a non-empty sequence over {A, C, G, T}.
FastaRecord read_reference(const boost::filesystem::path& fasta_path);

} // namespace io
} // namespace polyscan

#endif
