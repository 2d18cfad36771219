#include "DataJarCli.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace DJ::Tools::CLI {

DataJarCli::DataJarCli() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown option '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void DataJarCli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void DataJarCli::set_positional_handler(std::function<ParseError(std::string_view)> handler) {
    positional_handler_ = std::move(handler);
}

void DataJarCli::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void DataJarCli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void DataJarCli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = false;
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void DataJarCli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_optional = option.value_optional;
    entry.allow_leading_dash_value = option.allow_leading_dash_value;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void DataJarCli::add_int(std::string_view name, IntOption option) {
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
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void DataJarCli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool DataJarCli::parse(int argc, char const* const* argv) {
    had_error_ = false;
    options_ended_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};

        if (options_ended_ || !looks_like_option(raw_token)) {
            if (!positional_handler_) {
                if (unknown_handler_ && !unknown_handler_(raw_token)) {
                    mark_error();
                }
                continue;
            }
            if (auto error = positional_handler_(raw_token)) {
                log_error(*error);
                mark_error();
            }
            continue;
        }
        if (raw_token == "--") {
            options_ended_ = true;
            continue;
        }

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
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::optional<std::string_view> resolved_value = attached_value;
        if (!resolved_value && (i + 1) < argc) {
            std::string_view candidate{argv[i + 1]};
            bool treat_as_option = looks_like_option(candidate) && (!entry->allow_leading_dash_value || find_option(candidate) != nullptr);
            if (!treat_as_option) {
                resolved_value = candidate;
                ++i;
            }
        }
        if (!resolved_value && !entry->value_optional) {
            log_error(entry->name + " requires a value");
            mark_error();
            continue;
        }

        if (entry->value_handler) {
            auto error = entry->value_handler(resolved_value);
            if (error) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool DataJarCli::had_errors() const {
    return had_error_;
}

DataJarCli::OptionEntry* DataJarCli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void DataJarCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void DataJarCli::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"datajar"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool DataJarCli::looks_like_option(std::string_view token) const {
    // "-5" is a value, not an option.
    if (token.size() < 2 || token.front() != '-') {
        return false;
    }
    char const next = token[1];
    return next == '-' || (!(next >= '0' && next <= '9') && next != '.');
}

void DataJarCli::mark_error() {
    had_error_ = true;
}

} // namespace DJ::Tools::CLI
