#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace lpi {

// ============================================================================
// ArgValue / Args
// ============================================================================

long long ArgValue::as_int(long long default_val) const {
    if (!is_set) return default_val;
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error("Expected an integer, got '" + value + "'");
    }
    return parsed;
}

int ArgValue::as_int_in_range(const std::string& field, long long lo, long long hi) const {
    long long parsed = as_int();
    if (parsed < lo || parsed > hi) {
        throw InvalidConfigurationError(field, "value " + value + " is outside [" +
                                        std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return static_cast<int>(parsed);
}

double ArgValue::as_double(double default_val) const {
    if (!is_set) return default_val;
    size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error("Expected a number, got '" + value + "'");
    }
    return parsed;
}

std::vector<std::string> ArgValue::as_list(char delim) const {
    std::vector<std::string> result;
    if (!is_set) return result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

std::vector<int> ArgValue::as_int_list(char delim) const {
    std::vector<int> result;
    for (const auto& item : as_list(delim)) {
        long long parsed = ArgValue{item, true}.as_int();
        if (parsed < INT_MIN || parsed > INT_MAX) {
            throw std::runtime_error("Integer out of range: '" + item + "'");
        }
        result.push_back(static_cast<int>(parsed));
    }
    return result;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return ArgValue{default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

std::string Args::require(const std::string& name) const {
    if (!has(name)) {
        throw std::runtime_error("Missing required argument: --" + name);
    }
    return named.at(name).value;
}

// ============================================================================
// Command
// ============================================================================

void Command::print_help(const std::string& program_name) const {
    std::cout << "\nUsage: " << program_name << " " << name;
    for (const auto& arg : args) {
        if (arg.required) std::cout << " --" << arg.name << " <value>";
    }
    std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& arg : args) {
        std::cout << "  --" << arg.name;
        if (!arg.short_name.empty()) std::cout << ", -" << arg.short_name;
        if (!arg.is_flag) std::cout << " <value>";
        std::cout << "\n      " << arg.description;
        if (!arg.choices.empty()) {
            std::cout << " {";
            for (size_t i = 0; i < arg.choices.size(); ++i) {
                std::cout << (i ? "|" : "") << arg.choices[i];
            }
            std::cout << "}";
        }
        if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
        if (arg.required) std::cout << " [required]";
        std::cout << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// CLI
// ============================================================================

CLI::CLI(const std::string& program_name, const std::string& version)
    : program_name_(program_name), version_(version) {}

void CLI::register_command(Command cmd) {
    std::string key = cmd.name;
    commands_[key] = std::move(cmd);
}

int CLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_help();
        return kExitUsage;
    }

    std::string cmd_name = argv[1];
    if (cmd_name == "--help" || cmd_name == "-h") {
        print_help();
        return kExitOk;
    }
    if (cmd_name == "--version") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return kExitOk;
    }

    auto it = commands_.find(cmd_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << cmd_name << "\n"
                  << "Run '" << program_name_ << " --help' for available commands.\n";
        return kExitUsage;
    }
    const Command& cmd = it->second;

    std::vector<std::string> rest(argv + 2, argv + argc);
    if (std::find(rest.begin(), rest.end(), "--help") != rest.end() ||
        std::find(rest.begin(), rest.end(), "-h") != rest.end()) {
        cmd.print_help(program_name_);
        return kExitOk;
    }

    Args args;
    try {
        args = parse_args(cmd, rest);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        cmd.print_help(program_name_);
        return kExitUsage;
    }

    try {
        return cmd.handler(args);
    } catch (const InvalidConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }
}

void CLI::print_help() const {
    std::cout << program_name_ << " - Life Pattern Intelligence CLI\n\n"
              << "Usage: " << program_name_ << " <command> [options]\n\n"
              << "Commands:\n";
    for (const auto& [name, cmd] : commands_) {
        std::cout << "  " << name << std::string(name.size() < 16 ? 16 - name.size() : 1, ' ')
                  << cmd.description << "\n";
    }
    std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n"
              << "Defaults can be overridden with LPI_* environment variables.\n"
              << "\nVersion: " << version_ << "\n";
}

Args CLI::parse_args(const Command& cmd, const std::vector<std::string>& argv) {
    Args result;

    std::map<std::string, const ArgDef*> lookup;
    for (const auto& arg : cmd.args) {
        lookup["--" + arg.name] = &arg;
        if (!arg.short_name.empty()) lookup["-" + arg.short_name] = &arg;
    }

    for (size_t i = 0; i < argv.size(); ++i) {
        std::string token = argv[i];
        if (token.empty() || token[0] != '-') {
            result.positional.push_back(token);
            continue;
        }

        std::string inline_value;
        bool has_inline = false;
        auto eq = token.find('=');
        if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = token.substr(eq + 1);
            token = token.substr(0, eq);
            has_inline = true;
        }

        auto found = lookup.find(token);
        if (found == lookup.end()) {
            throw std::runtime_error("Unknown argument: " + argv[i]);
        }
        const ArgDef& def = *found->second;

        std::string value;
        if (def.is_flag) {
            if (has_inline) {
                throw std::runtime_error("Flag --" + def.name + " takes no value");
            }
            value = "true";
        } else if (has_inline) {
            value = inline_value;
        } else {
            if (i + 1 >= argv.size()) {
                throw std::runtime_error("Argument " + token + " requires a value");
            }
            value = argv[++i];
        }

        if (!def.choices.empty() &&
            std::find(def.choices.begin(), def.choices.end(), value) == def.choices.end()) {
            throw std::runtime_error("Invalid value '" + value + "' for --" + def.name);
        }
        result.named[def.name] = ArgValue{value, true};
    }

    for (const auto& arg : cmd.args) {
        if (result.named.count(arg.name)) continue;
        if (arg.required) {
            throw std::runtime_error("Missing required argument: --" + arg.name);
        }
        if (!arg.default_value.empty()) {
            result.named[arg.name] = ArgValue{arg.default_value, true};
        }
    }

    return result;
}

} // namespace lpi
