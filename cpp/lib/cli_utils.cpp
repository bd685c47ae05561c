/**
 * CLI Utilities Implementation
 */

#include "cli_utils.hpp"
#include <sstream>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace chunked {
namespace cli {

// ============================================================================
// StringUtils Implementation
// ============================================================================

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

std::string StringUtils::abbreviate(const std::string& str, size_t max_length) {
    std::string result;

    for (char c : str) {
        if (c == '\n') {
            result += "\\n";
        } else if (c == '\r') {
            result += "\\r";
        } else {
            result += c;
        }
    }

    if (result.size() > max_length) {
        result = result.substr(0, max_length > 3 ? max_length - 3 : 0) + "...";
    }

    return result;
}

// ============================================================================
// ArgumentParser Implementation
// ============================================================================

ArgumentParser::ArgumentParser(const std::string& program_name, const std::string& description)
    : program_name_(program_name), description_(description), help_requested_(false) {
}

void ArgumentParser::add_argument(const Argument& arg) {
    arguments_.push_back(arg);
}

const ArgumentParser::Argument* ArgumentParser::find_argument(const std::string& flag) const {
    auto it = std::find_if(arguments_.begin(), arguments_.end(), [&flag](const Argument& arg) {
        return !flag.empty() && (arg.short_flag == flag || arg.long_flag == flag);
    });
    return it == arguments_.end() ? nullptr : &*it;
}

std::string ArgumentParser::normalize_flag(const std::string& flag) const {
    // Values are stored under the short flag when there is one
    const Argument* arg = find_argument(flag);
    if (arg == nullptr) {
        return flag;
    }
    return arg->short_flag.empty() ? arg->long_flag : arg->short_flag;
}

bool ArgumentParser::parse(int argc, char* argv[]) {
    errors_.clear();
    values_.clear();
    help_requested_ = false;

    int index = 1;
    while (index < argc) {
        std::string token = argv[index++];

        if (token == "-h" || token == "--help") {
            help_requested_ = true;
            print_help();
            return false;
        }

        // "--name=value" carries its value inline
        std::string flag = token;
        std::string inline_value;
        bool has_inline_value = false;
        size_t equals = token.find('=');
        if (token.compare(0, 2, "--") == 0 && equals != std::string::npos) {
            flag = token.substr(0, equals);
            inline_value = token.substr(equals + 1);
            has_inline_value = true;
        }

        const Argument* definition = find_argument(flag);
        if (definition == nullptr) {
            errors_.push_back("Unknown argument: " + token);
            continue;
        }

        std::string key = normalize_flag(flag);
        if (values_.count(key) != 0) {
            errors_.push_back("Argument given more than once: " + flag);
        }

        if (!definition->has_value) {
            if (has_inline_value) {
                errors_.push_back("Argument " + flag + " does not take a value");
            }
            values_[key] = "true";
        } else if (has_inline_value) {
            values_[key] = inline_value;
        } else if (index < argc) {
            values_[key] = argv[index++];
        } else {
            errors_.push_back("Missing value for " + flag);
        }
    }

    for (const auto& definition : arguments_) {
        if (!definition.required) {
            continue;
        }
        std::string key = definition.short_flag.empty() ? definition.long_flag : definition.short_flag;
        if (values_.count(key) == 0) {
            errors_.push_back("Missing required argument: " + key);
        }
    }

    return errors_.empty();
}

std::string ArgumentParser::get(const std::string& flag) const {
    auto it = values_.find(normalize_flag(flag));
    if (it != values_.end()) {
        return it->second;
    }

    const Argument* arg = find_argument(flag);
    return arg == nullptr ? std::string() : arg->default_value;
}

bool ArgumentParser::has(const std::string& flag) const {
    return values_.count(normalize_flag(flag)) != 0;
}

bool ArgumentParser::help_requested() const {
    return help_requested_;
}

void ArgumentParser::print_help() const {
    // stdout may carry protocol output, so help goes to stderr
    std::ostringstream usage;
    usage << "Usage: " << program_name_ << " [options]\n\n" << description_ << "\n\nOptions:\n";

    for (const auto& arg : arguments_) {
        std::string names = arg.short_flag;
        if (!names.empty() && !arg.long_flag.empty()) {
            names += ", ";
        }
        names += arg.long_flag;
        if (arg.has_value) {
            names += " <" + (arg.value_name.empty() ? std::string("VALUE") : arg.value_name) + ">";
        }

        usage << "  " << std::left << std::setw(28) << names << arg.description;
        if (arg.required) {
            usage << " (required)";
        } else if (arg.has_value && !arg.default_value.empty()) {
            usage << " [" << arg.default_value << "]";
        }
        usage << "\n";
    }

    std::cerr << usage.str() << std::flush;
}

void ArgumentParser::print_error(const std::string& error) const {
    std::cerr << "Error: " << error << "\n" << std::endl;
    print_help();
}

std::vector<std::string> ArgumentParser::get_errors() const {
    return errors_;
}

// ============================================================================
// TableFormatter Implementation
// ============================================================================

TableFormatter::TableFormatter() {
}

void TableFormatter::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void TableFormatter::add_row(const std::vector<std::string>& row) {
    rows_.push_back(row);
}

void TableFormatter::set_alignment(int column, const std::string& alignment) {
    alignments_[column] = alignment;
}

std::vector<size_t> TableFormatter::calculate_widths() const {
    std::vector<size_t> widths(headers_.size(), 0);

    for (size_t i = 0; i < headers_.size(); i++) {
        widths[i] = headers_[i].size();
    }

    for (const auto& row : rows_) {
        if (row.size() > widths.size()) {
            widths.resize(row.size(), 0);
        }
        for (size_t i = 0; i < row.size(); i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    return widths;
}

std::string TableFormatter::format_cell(const std::string& content, size_t width,
                                        const std::string& alignment) const {
    std::ostringstream oss;
    if (alignment == "right") {
        oss << std::right << std::setw(static_cast<int>(width)) << content;
    } else {
        oss << std::left << std::setw(static_cast<int>(width)) << content;
    }
    return oss.str();
}

std::string TableFormatter::to_string() const {
    std::vector<size_t> widths = calculate_widths();
    std::ostringstream oss;

    auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t i = 0; i < widths.size(); i++) {
            if (i > 0) oss << "  ";
            auto it = alignments_.find(static_cast<int>(i));
            std::string alignment = (it != alignments_.end()) ? it->second : "left";
            oss << format_cell(i < row.size() ? row[i] : "", widths[i], alignment);
        }
        oss << "\n";
    };

    if (!headers_.empty()) {
        print_row(headers_);

        size_t total = 0;
        for (size_t w : widths) total += w;
        total += widths.empty() ? 0 : 2 * (widths.size() - 1);
        oss << std::string(total, '-') << "\n";
    }

    for (const auto& row : rows_) {
        print_row(row);
    }

    return oss.str();
}

// ============================================================================
// Validator Implementation
// ============================================================================

bool Validator::is_valid_file(const std::string& filepath, std::string* error) {
    struct stat info;
    std::string problem;

    if (filepath.empty()) {
        problem = "No input file given";
    } else if (stat(filepath.c_str(), &info) != 0) {
        problem = "No such file: " + filepath;
    } else if (!S_ISREG(info.st_mode)) {
        problem = "Not a regular file: " + filepath;
    } else if (access(filepath.c_str(), R_OK) != 0) {
        problem = "Permission denied: " + filepath;
    }

    if (!problem.empty() && error != nullptr) {
        *error = problem;
    }
    return problem.empty();
}

bool Validator::parse_count(const std::string& value, size_t& out, std::string* error) {
    std::string trimmed = StringUtils::trim(value);

    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
        if (error) *error = "Not a non-negative integer: " + value;
        return false;
    }

    try {
        out = static_cast<size_t>(std::stoull(trimmed));
    } catch (const std::out_of_range&) {
        if (error) *error = "Value out of range: " + value;
        return false;
    }

    return true;
}

} // namespace cli
} // namespace chunked
