// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <vector>
#include <iostream>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <utility>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "utils/string_utils.hpp"
#include "exceptions/user_error.hpp"
#include "core/tools/classifier.hpp"
#include "config.hpp"
#include "option_collation.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace polyscan { namespace options {

void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options);

// boost::option cannot handle option dependencies so we must do our own checks
void conflicting_options(const OptionMap& vm, const std::string& opt1, const std::string& opt2);
void check_positive(const std::string& option, const OptionMap& vm);
void check_percentage(const std::string& option, const OptionMap& vm);
void validate(const OptionMap& vm);

void store_options(po::command_line_parser& parser, OptionMap& vm);

OptionMap parse_options(const int argc, const char** argv)
{
    po::options_description general("General");
    general.add_options()
    ("help,h",
     "Report detailed option information")
    
    ("version",
     "Report detailed version information")
    
    ("config",
     po::value<fs::path>(),
     "Config file to populate command line options")
    
    ("debug",
     po::value<fs::path>()->implicit_value("polyscan_debug.log"),
     "Create log file for debugging")
    
    ("trace",
     po::value<fs::path>()->implicit_value("polyscan_trace.log"),
     "Create very verbose log file for debugging")
    
    ("working-directory,w",
     po::value<fs::path>(),
     "Sets the working directory")
    ;
    
    po::options_description input("Input/output");
    input.add_options()
    ("reference,R",
     po::value<fs::path>()->required(),
     "FASTA format reference genome file to compare against")
    
    ("query,q",
     po::value<std::string>(),
     "DNA sequence to analyse")
    
    ("query-file,Q",
     po::value<fs::path>(),
     "FASTA or plain text file containing the DNA sequence to analyse")
    
    ("output,o",
     po::value<fs::path>(),
     "File to write the analysis report to. If not given the report is written to stdout")
    
    ("line-width",
     po::value<int>()->default_value(0),
     "Maximum number of alignment columns per report line. 0 means no wrapping")
    ;
    
    po::options_description alignment("Alignment");
    alignment.add_options()
    ("match-score",
     po::value<double>()->default_value(1),
     "Score for aligning identical bases")
    
    ("mismatch-score",
     po::value<double>()->default_value(0),
     "Score for aligning different bases")
    
    ("gap-open-score",
     po::value<double>()->default_value(0),
     "Score for the first position of a gap")
    
    ("gap-extend-score",
     po::value<double>(),
     "Score for each subsequent position of a gap. Defaults to the gap open score")
    ;
    
    po::options_description classification("Classification");
    classification.add_options()
    ("threshold",
     po::value<double>()->default_value(coretools::DefaultDivergenceThreshold),
     "Queries with a similarity percentage below this are reported as infected")
    
    ("autojunk",
     po::bool_switch()->default_value(false),
     "Frequent bases in long queries may not seed matching blocks in the similarity calculation")
    ;
    
    po::options_description all("polyscan command line options");
    all.add(general).add(input).add(alignment).add(classification);
    
    OptionMap vm_init;
    store_options(po::command_line_parser(argc, argv).options(general).allow_unregistered(), vm_init);
    
    if (vm_init.count("help") == 1) {
        std::cout << all << std::endl;
        return vm_init;
    }
    
    if (vm_init.count("version") == 1) {
        std::cout << config::ProgramName << " version " << config::Version << '\n' << config::Build << std::endl;
        return vm_init;
    }
    
    OptionMap vm;
    // Stored values are never overwritten, so the command line takes precedence over the config file
    store_options(po::command_line_parser(argc, argv).options(all), vm);
    if (vm_init.count("config") == 1) {
        const auto config_path = resolve_path(vm_init.at("config").as<fs::path>(), vm_init);
        parse_config_file(config_path, vm, all);
    }
    validate(vm);
    po::notify(vm);
    
    return vm;
}

class CommandLineError : public UserError
{
public:
    CommandLineError() = default;
    
    CommandLineError(std::string&& why) : why_ {std::move(why)} {}
    
protected:
    std::string why_;

private:
    virtual std::string do_where() const override
    {
        return "parse_options";
    }
    
    virtual std::string do_why() const override
    {
        return why_;
    }
    
    virtual std::string do_help() const override
    {
        return "use the --help command to view required and allowable options";
    }
};

class BadConfigFile : public CommandLineError
{
public:
    BadConfigFile(fs::path p)
    {
        std::ostringstream ss {};
        ss << "The config file path (" << p << ") given in the option '--config' does not exist";
        why_ = ss.str();
    }
};

class UnknownCommandLineOption : public CommandLineError
{
public:
    UnknownCommandLineOption(std::string option)
    : CommandLineError { "The option you specified '--" + option + "' is not recognised"}
    {}
};

class MissingRequiredCommandLineArgument : public CommandLineError
{
public:
    MissingRequiredCommandLineArgument(std::string option)
    : CommandLineError {"The command line option '--" + option + "' is required but is missing"}
    {}
};

class InvalidCommandLineOptionValue : public CommandLineError
{
public:
    template <typename T>
    InvalidCommandLineOptionValue(std::string option, T value, std::string reason)
    {
        std::ostringstream ss {};
        ss << "The argument '" << value << "' given to option '--" << option << "' was rejected as it " << reason;
        why_ = ss.str();
    }
};

class ConflictingCommandLineOptions : public CommandLineError
{
public:
    ConflictingCommandLineOptions(std::vector<std::string> conflicts)
    {
        std::ostringstream ss {};
        ss << "the options";
        for (const auto& option : conflicts) {
            ss << " --" << option;
        }
        ss << " are mutually exclusive";
        why_ = ss.str();
    }
};

void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options)
{
    if (!fs::exists(config_file)) {
        throw BadConfigFile {config_file};
    }
    std::ifstream config {config_file.string()};
    if (config) {
        try {
            po::store(po::parse_config_file(config, options), vm);
        } catch (const po::invalid_config_file_syntax& e) {
            throw CommandLineError {e.what()};
        } catch (const po::unknown_option& e) {
            throw UnknownCommandLineOption {po::strip_prefixes(e.get_option_name())};
        } catch (const po::invalid_option_value& e) {
            throw CommandLineError {e.what()};
        } catch (const po::invalid_bool_value& e) {
            throw CommandLineError {e.what()};
        } catch (const po::ambiguous_option& e) {
            throw CommandLineError {e.what()};
        } catch (const po::reading_file& e) {
            throw CommandLineError {e.what()};
        }
    }
}

void check_positive(const std::string& option, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto value = vm.at(option).as<int>();
        if (value < 0) {
            throw InvalidCommandLineOptionValue {option, value, "must be positive" };
        }
    }
}

void check_percentage(const std::string& option, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto value = vm.at(option).as<double>();
        if (value < 0 || value > 100) {
            throw InvalidCommandLineOptionValue {option, value, "must be between 0 and 100" };
        }
    }
}

void conflicting_options(const OptionMap& vm, const std::string& opt1, const std::string& opt2)
{
    if (vm.count(opt1) == 1 && !vm[opt1].defaulted() && vm.count(opt2) == 1 && !vm[opt2].defaulted()) {
        throw ConflictingCommandLineOptions {{opt1, opt2}};
    }
}

void store_options(po::command_line_parser& parser, OptionMap& vm)
{
    try {
        po::store(parser.run(), vm);
    } catch (const po::required_option& e) {
        throw MissingRequiredCommandLineArgument {po::strip_prefixes(e.get_option_name())};
    } catch (const po::unknown_option& e) {
        throw UnknownCommandLineOption {po::strip_prefixes(e.get_option_name())};
    } catch (const po::invalid_option_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::invalid_bool_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::ambiguous_option& e) {
        throw CommandLineError {e.what()};
    } catch (const po::reading_file& e) {
        throw CommandLineError {e.what()};
    } catch (const po::invalid_command_line_syntax& e) {
        throw CommandLineError {e.what()};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

void validate(const OptionMap& vm)
{
    conflicting_options(vm, "query", "query-file");
    check_positive("line-width", vm);
    check_percentage("threshold", vm);
    if (vm.count("reference") == 0) {
        throw MissingRequiredCommandLineArgument {"reference"};
    }
}

namespace {

template <typename T>
bool is_type(const OptionMap::mapped_type& value)
{
    try {
        boost::any_cast<T>(value.value());
        return true;
    } catch (const boost::bad_any_cast&) {
        return false;
    }
}

} // namespace

std::ostream& operator<<(std::ostream& os, const OptionMap& options)
{
    std::size_t i {0};
    for (const auto& p : options) {
        const auto& label = p.first;
        const auto& value = p.second;
        const char bullet {value.defaulted() ? '>' : '~'};
        os << bullet << ' ' << label;
        if (value.empty()) {
            os << "(empty)";
        }
        os << "=";
        if (is_type<int>(value)) {
            os << value.as<int>();
        } else if (is_type<bool>(value)) {
            os << (value.as<bool>() ? "yes" : "no");
        } else if (is_type<double>(value)) {
            os << value.as<double>();
        } else if (is_type<std::string>(value)) {
            const auto& str = value.as<std::string>();
            if (str.size()) {
                os << str;
            } else {
                os << "true";
            }
        } else if (is_type<fs::path>(value)) {
            os << value.as<fs::path>().filename().string();
        } else if (!value.empty()) {
            os << "UnknownType(" << value.value().type().name() << ")";
        }
        if (++i != options.size()) os << std::endl;
    }
    return os;
}

std::string to_string(const OptionMap& options, const bool one_line, const bool mark_modified)
{
    std::ostringstream ss {};
    ss << options;
    auto result = ss.str();
    if (one_line) {
        auto chunks = utils::split(result, '\n');
        for (auto& chunk : chunks) {
            if (chunk.size() < 2 || chunk.find('=') == std::string::npos) continue;
            const bool modified {chunk[0] == '~'};
            chunk[0] = '-';
            chunk[1] = '-';
            if (modified && mark_modified) {
                chunk.insert(0, 1,'*');
            }
            chunk[chunk.find('=')] = ' ';
        }
        result = utils::join(chunks, ' ');
    }
    return result;
}

} // namespace options
} // namespace polyscan
