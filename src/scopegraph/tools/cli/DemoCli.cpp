#include "DemoCli.hpp"

#include <cctype>
#include <charconv>
#include <iostream>
#include <sstream>
#include <string>

namespace SG::Tools {

DemoCli::DemoCli() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void DemoCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void DemoCli::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void DemoCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void DemoCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void DemoCli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_optional = option.value_optional;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void DemoCli::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return stored + " requires an integer value";
        }
        int value = 0;
        auto begin = token->data();
        auto end = begin + token->size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects an integer value";
        }
        return handler(value);
    };
    add_value(name, std::move(value_opt));
}

void DemoCli::add_double(std::string_view name, DoubleOption option) {
    ValueOption value_opt{};
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return stored + " requires a floating-point value";
        }
        std::string buffer(token->begin(), token->end());
        std::stringstream stream(buffer);
        double value = 0.0;
        stream >> value;
        if (stream.fail() || !stream.eof()) {
            return stored + " expects a floating-point value";
        }
        return handler(value);
    };
    add_value(name, std::move(value_opt));
}

void DemoCli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool DemoCli::parse(int argc, char** argv) {
    errors_.clear();
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(raw_token)) {
                mark_error();
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::optional<std::string_view> resolved_value = attached_value;
        if (!resolved_value) {
            bool has_next = (i + 1) < argc && !looks_like_option(argv[i + 1]);
            if (has_next) {
                ++i;
                resolved_value = std::string_view{argv[i]};
            } else if (!entry->value_optional) {
                log_error(entry->name + " requires a value");
                continue;
            }
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(resolved_value)) {
                log_error(*error);
            }
        }
    }
    return !had_error_;
}

bool DemoCli::had_errors() const {
    return had_error_;
}

DemoCli::OptionEntry* DemoCli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void DemoCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void DemoCli::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"scopegraph"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    errors_.push_back(text);
    mark_error();
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

// A lone "-" and negative numbers are values, not options.
bool DemoCli::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-' && !(std::isdigit(static_cast<unsigned char>(token[1])) || token[1] == '.');
}

void DemoCli::mark_error() {
    had_error_ = true;
}

void register_demo_options(DemoCli& cli, DemoSettings& settings) {
    cli.add_int("--ticks", {.on_value = [&settings](int value) -> DemoCli::ParseError {
        if (value <= 0) {
            return std::string{"--ticks must be positive"};
        }
        settings.ticks = value;
        return std::nullopt;
    }});
    cli.add_double("--dt", {.on_value = [&settings](double value) -> DemoCli::ParseError {
        if (value < 0.0) {
            return std::string{"--dt must not be negative"};
        }
        settings.dt = value;
        return std::nullopt;
    }});
    cli.add_double("--slider", {.on_value = [&settings](double value) -> DemoCli::ParseError {
        settings.slider = value;
        return std::nullopt;
    }});
    cli.add_value("--config", {.on_value = [&settings](std::optional<std::string_view> value) -> DemoCli::ParseError {
        if (!value || value->empty()) {
            return std::string{"--config requires a file path"};
        }
        settings.config_path = std::string(value->begin(), value->end());
        return std::nullopt;
    }});
    cli.add_flag("--json", {.on_set = [&settings] { settings.print_json = true; }});
    cli.add_flag("--log", {.on_set = [&settings] { settings.enable_log = true; }});
    cli.add_flag("--help", {.on_set = [&settings] { settings.show_help = true; }});
    cli.add_alias("-n", "--ticks");
    cli.add_alias("-h", "--help");
}

std::string demo_usage(std::string_view program) {
    std::string text = "usage: ";
    text.append(program.begin(), program.end());
    text.append(" [--ticks N] [--dt SECONDS] [--slider VALUE] [--config FILE] [--json] [--log]\n");
    return text;
}

} // namespace SG::Tools
