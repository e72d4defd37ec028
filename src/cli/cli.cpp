#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ag {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string display_name(const OptionSpec& spec) {
    std::string text = "--" + spec.name;
    if (!spec.alias.empty()) {
        text += ", -" + spec.alias;
    }
    if (!spec.flag) {
        text += " <value>";
    }
    return text;
}

}  // namespace

// ==========================================
// OptionValue
// ==========================================

int OptionValue::to_int(int fallback) const {
    if (!present) return fallback;
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw UsageError("--" + option + " expects an integer, got '" + text + "'");
    }
    return result;
}

double OptionValue::to_double(double fallback) const {
    if (!present) return fallback;
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw UsageError("--" + option + " expects a number, got '" + text + "'");
    }
    return result;
}

bool OptionValue::to_bool(bool fallback) const {
    if (!present) return fallback;
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

std::vector<std::string> OptionValue::to_list(char delim) const {
    std::vector<std::string> items;
    if (!present) return items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// ==========================================
// ParsedArgs
// ==========================================

OptionValue ParsedArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options_.find(name);
    if (it != options_.end()) return it->second;
    return OptionValue{name, fallback, !fallback.empty()};
}

bool ParsedArgs::has(const std::string& name) const {
    auto it = options_.find(name);
    return it != options_.end() && it->second.present;
}

const std::string& ParsedArgs::require(const std::string& name) const {
    auto it = options_.find(name);
    if (it == options_.end() || !it->second.present) {
        throw UsageError("Missing required option: --" + name);
    }
    return it->second.text;
}

// ==========================================
// CommandLine
// ==========================================

CommandLine::CommandLine(std::string program, std::string version)
    : program_(std::move(program)), version_(std::move(version)) {}

void CommandLine::add_shared_options(std::vector<OptionSpec> options) {
    shared_options_.insert(shared_options_.end(), options.begin(), options.end());
}

CommandLine& CommandLine::add(Subcommand command) {
    command.options.insert(command.options.end(), shared_options_.begin(), shared_options_.end());
    commands_.push_back(std::move(command));
    return *this;
}

const Subcommand* CommandLine::find(const std::string& name) const {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&name](const Subcommand& c) { return c.name == name; });
    return it == commands_.end() ? nullptr : &*it;
}

ParsedArgs CommandLine::parse(const Subcommand& command, const std::vector<std::string>& tokens) {
    ParsedArgs result;

    auto lookup = [&command](const std::string& token) -> const OptionSpec* {
        for (const auto& spec : command.options) {
            if (token == "--" + spec.name) return &spec;
            if (!spec.alias.empty() && token == "-" + spec.alias) return &spec;
        }
        return nullptr;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token.empty() || token[0] != '-' || token == "-") {
            result.positional_.push_back(token);
            continue;
        }

        std::string key = token;
        std::string inline_value;
        bool has_inline = false;
        if (token.rfind("--", 0) == 0) {
            auto eq = token.find('=');
            if (eq != std::string::npos) {
                key = token.substr(0, eq);
                inline_value = token.substr(eq + 1);
                has_inline = true;
            }
        }

        const OptionSpec* spec = lookup(key);
        if (!spec) {
            throw UsageError("Unknown option for '" + command.name + "': " + key);
        }

        if (spec->flag) {
            if (has_inline) {
                OptionValue parsed{spec->name, inline_value, true};
                if (!parsed.to_bool()) continue;
            }
            result.options_[spec->name] = OptionValue{spec->name, "true", true};
        } else if (has_inline) {
            result.options_[spec->name] = OptionValue{spec->name, inline_value, true};
        } else {
            if (i + 1 >= tokens.size()) {
                throw UsageError("Option " + key + " requires a value");
            }
            result.options_[spec->name] = OptionValue{spec->name, tokens[++i], true};
        }
    }

    for (const auto& spec : command.options) {
        if (result.options_.count(spec.name)) continue;
        if (spec.required) {
            throw UsageError("Missing required option: --" + spec.name);
        }
        if (!spec.default_value.empty()) {
            result.options_[spec.name] = OptionValue{spec.name, spec.default_value, true};
        }
    }

    return result;
}

int CommandLine::run(int argc, char** argv) const {
    std::vector<std::string> tokens(argv + std::min(argc, 1), argv + argc);
    if (tokens.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    const std::string& first = tokens.front();
    if (first == "--help" || first == "-h" || first == "help") {
        print_usage(std::cout);
        return 0;
    }
    if (first == "--version" || first == "-v") {
        std::cout << program_ << " " << version_ << "\n";
        return 0;
    }

    const Subcommand* command = find(first);
    if (!command) {
        std::cerr << "Unknown command: " << first << "\n";
        std::cerr << "Run '" << program_ << " --help' for the list of commands.\n";
        return 2;
    }

    tokens.erase(tokens.begin());
    if (std::find(tokens.begin(), tokens.end(), "--help") != tokens.end() ||
        std::find(tokens.begin(), tokens.end(), "-h") != tokens.end()) {
        print_command_usage(*command, std::cout);
        return 0;
    }

    ParsedArgs args;
    try {
        args = parse(*command, tokens);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_command_usage(*command, std::cerr);
        return 2;
    }

    try {
        return command->action(args);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CommandLine::print_usage(std::ostream& out) const {
    out << program_ << " " << version_ << " - asset relationship graph\n\n";
    out << "Usage: " << program_ << " <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& command : commands_) {
        out << "  " << std::left << std::setw(14) << command.name << command.summary << "\n";
    }
    out << "\nRun '" << program_ << " <command> --help' for the options of a command.\n";
}

void CommandLine::print_command_usage(const Subcommand& command, std::ostream& out) const {
    out << "\nUsage: " << program_ << " " << command.name;
    for (const auto& spec : command.options) {
        if (spec.required) out << " --" << spec.name << " <value>";
    }
    out << " [options]\n\n" << command.summary << "\n\nOptions:\n";

    for (const auto& spec : command.options) {
        out << "  " << std::left << std::setw(26) << display_name(spec) << spec.help;
        if (!spec.default_value.empty()) out << " (default: " << spec.default_value << ")";
        if (spec.required) out << " [required]";
        out << "\n";
    }
    out << "\n";
}

} // namespace ag
