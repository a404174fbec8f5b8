// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <cctype>
#include <utility>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "config/common.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace polyscan {

namespace {

bool starts_with_vowel(const std::string& word) noexcept
{
    if (word.empty()) return false;
    switch (std::tolower(static_cast<unsigned char>(word.front()))) {
        case 'a': case 'e': case 'i': case 'o': case 'u': return true;
        default: return false;
    }
}

std::string make_heading(const Error& error)
{
    const auto type = error.type();
    return (starts_with_vowel(type) ? "An " : "A ") + type + " error has occurred:";
}

std::string as_sentence(std::string text)
{
    utils::capitalise_front(text);
    if (!text.empty() && text.back() != '.' && text.back() != '!' && text.back() != '?') text += '.';
    return text;
}

std::string make_help_sentence(std::string help)
{
    help.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(help.front())));
    return as_sentence("to resolve this error, " + help);
}

class BadAlloc : public SystemError
{
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return "system could not satisfy memory request"; }
    std::string do_help() const override
    {
        return "ensure the system has sufficient resources for the alignment matrices, "
               "which grow with the product of the reference and query lengths";
    }
};

class UnclassifiedError : public Error
{
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "rerun with --debug and " + config::BugReport;
    }
    
    std::string why_;
    
public:
    UnclassifiedError(std::string why) : why_ {std::move(why)} {}
};

} // namespace

std::vector<std::string> make_error_report(const Error& error, const std::size_t line_width)
{
    static const std::string indent {"    "};
    std::vector<std::string> result {make_heading(error), ""};
    const auto why_width = line_width > indent.size() ? line_width - indent.size() : 1;
    for (const auto& line : utils::wrap(as_sentence(error.why()), why_width)) {
        result.push_back(indent + line);
    }
    const auto help = error.help();
    if (!help.empty()) {
        result.emplace_back();
        const auto help_lines = utils::wrap(make_help_sentence(help), line_width);
        result.insert(result.end(), help_lines.cbegin(), help_lines.cend());
    }
    return result;
}

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    for (const auto& line : make_error_report(error, config::CommandLineWidth)) {
        log << line;
    }
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Raised " << error;
}

void log_error(const std::bad_alloc& error)
{
    const BadAlloc e {};
    log_error(e);
}

void log_error(const std::exception& error)
{
    const UnclassifiedError e {error.what()};
    log_error(e);
}

void log_unknown_error()
{
    const UnclassifiedError e {"unknown"};
    log_error(e);
}

} // namespace polyscan
