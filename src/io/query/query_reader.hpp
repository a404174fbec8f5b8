// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef query_reader_hpp
#define query_reader_hpp

#include <string>
#include <iosfwd>

#include <boost/filesystem/path.hpp>

#include "config/common.hpp"

namespace polyscan { namespace io {

extern const std::string QueryPrompt;

// Surrounding whitespace removed and bases capitalised. The alphabet is not checked.
NucleotideSequence normalise_query(std::string sequence);

// Writes QueryPrompt to prompt and reads one line from in. Returns an empty sequence at end of input.
NucleotideSequence read_query(std::istream& in, std::ostream& prompt);

// A FASTA or plain text file holding a single sequence.
NucleotideSequence read_query_file(const boost::filesystem::path& query_path);

} // namespace io
} // namespace polyscan

#endif
