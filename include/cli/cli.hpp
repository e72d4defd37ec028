#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace ag {

// ============================================================================
// Command-line parsing
// ============================================================================

/**
 * @brief One parsed option value
 *
 * Conversions are strict: "12abc" is not a number. Failures throw UsageError
 * naming the option.
 */
struct OptionValue {
    std::string option;     // option name without dashes, for messages
    std::string text;
    bool present = false;

    explicit operator bool() const { return present; }

    const std::string& str() const { return text; }
    int to_int(int fallback = 0) const;
    double to_double(double fallback = 0.0) const;

    // "1", "true", "yes" and "on" are true
    bool to_bool(bool fallback = false) const;

    /// Split on delim, dropping empty items and surrounding spaces
    std::vector<std::string> to_list(char delim = ',') const;
};

/**
 * @brief Options and positionals of one invocation
 */
class ParsedArgs {
public:
    /**
     * @brief Value of an option, or fallback text when it was not given
     */
    OptionValue get(const std::string& name, const std::string& fallback = "") const;

    bool has(const std::string& name) const;

    /**
     * @throws UsageError when the option is absent
     */
    const std::string& require(const std::string& name) const;

    const std::vector<std::string>& positional() const { return positional_; }

private:
    friend class CommandLine;

    std::map<std::string, OptionValue> options_;
    std::vector<std::string> positional_;
};

struct OptionSpec {
    std::string name;
    std::string alias;          // single letter, optional
    std::string help;
    std::string default_value;
    bool required = false;
    bool flag = false;          // presence only, takes no value
};

struct Subcommand {
    std::string name;
    std::string summary;
    std::vector<OptionSpec> options;
    std::function<int(const ParsedArgs&)> action;
};

/**
 * @brief Subcommand dispatcher: "<program> <command> [options]"
 *
 * Shared options are appended to every command registered after them.
 * run() turns exceptions into exit codes: 2 for usage errors, 1 for
 * failures inside a command.
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version);

    void add_shared_options(std::vector<OptionSpec> options);
    CommandLine& add(Subcommand command);

    int run(int argc, char** argv) const;

    void print_usage(std::ostream& out) const;
    void print_command_usage(const Subcommand& command, std::ostream& out) const;

    /**
     * @throws UsageError on unknown options, missing values or missing
     *         required options
     */
    static ParsedArgs parse(const Subcommand& command, const std::vector<std::string>& tokens);

private:
    std::string program_;
    std::string version_;
    std::vector<OptionSpec> shared_options_;
    std::vector<Subcommand> commands_;      // registration order

    const Subcommand* find(const std::string& name) const;
};

} // namespace ag
