#pragma once

#include <climits>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lpi {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;      // runtime or data error
constexpr int kExitUsage = 2;        // bad arguments or configuration

// One parsed option value; numeric accessors throw std::runtime_error on malformed text
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    long long as_int(long long default_val = 0) const;
    double as_double(double default_val = 0.0) const;

    // Integer within [lo, hi]; out of range throws InvalidConfigurationError(field)
    int as_int_in_range(const std::string& field, long long lo = INT_MIN, long long hi = INT_MAX) const;

    // Comma separated items, empty items dropped
    std::vector<std::string> as_list(char delim = ',') const;
    std::vector<int> as_int_list(char delim = ',') const;
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;

    // Value of a mandatory option; throws std::runtime_error when absent
    std::string require(const std::string& name) const;
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;                // presence means true, no value consumed
    std::vector<std::string> choices;    // allowed values, empty = any
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const;
};

/**
 * @brief Subcommand dispatcher for the lpi executable
 *
 * `lpi <command> [--name value | --name=value | -x value | --flag]`.
 * Usage and configuration errors exit with kExitUsage, anything else a
 * handler throws exits with kExitFailure.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version);

    void register_command(Command cmd);

    int run(int argc, char** argv);

    void print_help() const;

    /**
     * @brief Parse the arguments that follow the command name
     * @throws std::runtime_error for unknown options, missing values,
     *         missing required options or values outside choices
     */
    static Args parse_args(const Command& cmd, const std::vector<std::string>& argv);

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace lpi
