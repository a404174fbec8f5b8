// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "fasta_reader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <boost/filesystem/operations.hpp>

#include "utils/string_utils.hpp"
#include "utils/sequence_utils.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "exceptions/system_error.hpp"
#include "exceptions/file_error.hpp"

namespace polyscan { namespace io {

class MissingFasta : public MissingFileError
{
    std::string do_where() const override
    {
        return "read_fasta";
    }
public:
    MissingFasta(boost::filesystem::path file) : MissingFileError {std::move(file), "fasta"} {}
};

class UnreadableFasta : public FileError<SystemError>
{
    std::string do_where() const override
    {
        return "read_fasta";
    }
    
    std::string do_why() const override
    {
        return describe_file() + " could not be opened for reading";
    }
    
    std::string do_help() const override
    {
        return "check you have read permission for the file";
    }
public:
    UnreadableFasta(Path file) : FileError {std::move(file), std::string {"fasta"}} {}
};

class MalformedFasta : public MalformedFileError
{
    std::string do_where() const override
    {
        return "read_reference";
    }
public:
    MalformedFasta(boost::filesystem::path file) : MalformedFileError {std::move(file), "fasta"} {}
};

namespace {

bool is_header(const std::string& line) noexcept
{
    return !line.empty() && line.front() == '>';
}

} // namespace

FastaRecord read_fasta(std::istream& in)
{
    FastaRecord result {};
    bool seen_header {false};
    std::string line {};
    while (std::getline(in, line)) {
        if (is_header(line)) {
            if (!seen_header) {
                result.name = line.substr(1);
                utils::trim(result.name);
                seen_header = true;
            }
        } else {
            utils::strip_whitespace(line);
            result.sequence += line;
        }
    }
    utils::capitalise(result.sequence);
    return result;
}

FastaRecord read_fasta(const boost::filesystem::path& fasta_path)
{
    if (!boost::filesystem::exists(fasta_path)) {
        throw MissingFasta {fasta_path};
    }
    std::ifstream file {fasta_path.string()};
    if (!file) {
        throw UnreadableFasta {fasta_path};
    }
    return read_fasta(file);
}

FastaRecord read_reference(const boost::filesystem::path& fasta_path)
{
    auto result = read_fasta(fasta_path);
    if (result.sequence.empty()) {
        MalformedFasta e {fasta_path};
        e.set_reason("it contains no sequence data");
        throw e;
    }
    const auto bad_position = utils::find_non_canonical_base(result.sequence);
    if (bad_position) {
        MalformedFasta e {fasta_path};
        std::ostringstream ss {};
        ss << "the sequence has the non-ACGT symbol '" << result.sequence[*bad_position]
           << "' at position " << (*bad_position + 1);
        e.set_reason(ss.str());
        throw e;
    }
    return result;
}

} // namespace io
} // namespace polyscan
