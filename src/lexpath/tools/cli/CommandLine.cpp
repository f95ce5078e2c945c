#include "CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace LP::CLI {

CommandLine::CommandLine() {
    positional_handler_ = [](std::string_view token) -> ParseError {
        std::string message = "unexpected argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        return message;
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        int  value  = 0;
        auto end    = token.data() + token.size();
        auto result = std::from_chars(token.data(), end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        return handler(value);
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        had_error_ = true;
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    had_error_            = false;
    bool only_positionals = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        if (!only_positionals && raw_token == "--") {
            only_positionals = true;
            continue;
        }
        if (only_positionals || !looks_like_option(raw_token)) {
            report(positional_handler_(raw_token));
            continue;
        }

        std::optional<std::string_view> attached_value;
        std::string_view                name       = raw_token;
        auto                            equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            std::string message = "unknown option '";
            message.append(name.begin(), name.end());
            message.push_back('\'');
            report(message);
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                report(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        if (!attached_value) {
            if ((i + 1) >= argc) {
                report(entry->name + " requires a value");
                continue;
            }
            ++i;
            attached_value = std::string_view{argv[i]};
        }
        if (entry->value_handler) {
            report(entry->value_handler(*attached_value));
        }
    }
    return !had_error_;
}

bool CommandLine::had_errors() const {
    return had_error_;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void CommandLine::report(ParseError const& error) {
    if (!error) {
        return;
    }
    log_error(*error);
    had_error_ = true;
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"lexpath"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool CommandLine::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

} // namespace LP::CLI
