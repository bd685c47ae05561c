/**
 * CLI Utilities
 *
 * Command-line helpers shared by the chunk tools:
 * - Command-line argument parsing
 * - Numeric option validation
 * - Table output for chunk summaries
 */

#ifndef CLI_UTILS_HPP
#define CLI_UTILS_HPP

#include <string>
#include <vector>
#include <map>

namespace chunked {
namespace cli {

/**
 * String manipulation utilities
 */
class StringUtils {
public:
    /**
     * Trim whitespace from both ends of string
     */
    static std::string trim(const std::string& str);

    /**
     * Check if string ends with suffix
     */
    static bool ends_with(const std::string& str, const std::string& suffix);

    /**
     * Shorten str to max_length characters, marking the cut with "..."
     * Newlines and carriage returns are shown as "\n" and "\r"
     */
    static std::string abbreviate(const std::string& str, size_t max_length);
};

/**
 * Command-line argument parser
 */
class ArgumentParser {
public:
    struct Argument {
        std::string short_flag;      // e.g., "-n"
        std::string long_flag;       // e.g., "--records"
        std::string description;
        bool required;
        bool has_value;              // true if argument takes a value
        std::string default_value;
        std::string value_name;      // e.g., "FILE" for display in help
    };

    ArgumentParser(const std::string& program_name, const std::string& description);

    /**
     * Add argument definition
     */
    void add_argument(const Argument& arg);

    /**
     * Parse command-line arguments
     * @param argc Argument count from main()
     * @param argv Argument array from main()
     * @return true if parsing succeeded
     */
    bool parse(int argc, char* argv[]);

    /**
     * Get value of argument by flag
     * @param flag Short or long flag (e.g., "-n" or "--records")
     * @return Argument value or default value if not set
     */
    std::string get(const std::string& flag) const;

    /**
     * Check if argument was provided
     */
    bool has(const std::string& flag) const;

    /**
     * True after -h / --help was seen
     */
    bool help_requested() const;

    /**
     * Print help message to stderr
     */
    void print_help() const;

    /**
     * Print error message and help
     */
    void print_error(const std::string& error) const;

    /**
     * Get all errors from parsing
     */
    std::vector<std::string> get_errors() const;

private:
    std::string program_name_;
    std::string description_;
    std::vector<Argument> arguments_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> errors_;
    bool help_requested_;

    const Argument* find_argument(const std::string& flag) const;
    std::string normalize_flag(const std::string& flag) const;
};

/**
 * Table formatter for console output
 */
class TableFormatter {
public:
    TableFormatter();

    /**
     * Set column headers
     */
    void set_headers(const std::vector<std::string>& headers);

    /**
     * Add a row
     */
    void add_row(const std::vector<std::string>& row);

    /**
     * Set column alignment ("left" or "right")
     */
    void set_alignment(int column, const std::string& alignment);

    /**
     * Get formatted table as string
     */
    std::string to_string() const;

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::map<int, std::string> alignments_;

    std::vector<size_t> calculate_widths() const;
    std::string format_cell(const std::string& content, size_t width, const std::string& alignment) const;
};

/**
 * Input validation utilities
 */
class Validator {
public:
    /**
     * Validate file exists and is readable
     */
    static bool is_valid_file(const std::string& filepath, std::string* error = nullptr);

    /**
     * Parse a non-negative integer option
     * @param value Text to parse
     * @param out Parsed value (unchanged on failure)
     */
    static bool parse_count(const std::string& value, size_t& out, std::string* error = nullptr);
};

} // namespace cli
} // namespace chunked

#endif // CLI_UTILS_HPP
