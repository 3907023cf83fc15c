//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "grade_logs.h"

namespace gridscore::po {

using strvec = std::vector<std::string>;

class OptionError : public std::exception {
  public:
    explicit OptionError(std::string_view s) : what_str_(s) {}
    const char *what() const noexcept override { return what_str_.c_str(); }

  private:
    std::string what_str_;
};
// a required argument is absent
class ArgNotFound : public OptionError {
  public:
    using OptionError::OptionError;
};
// an argument is present but unusable
class InvalidArg : public OptionError {
  public:
    using OptionError::OptionError;
};
// no option or command of that name
class NotExist : public OptionError {
  public:
    using OptionError::OptionError;
};

template <typename T>
concept number_like = requires(T num) {
    std::from_chars(std::declval<const char *>(), std::declval<const char *>(), num);
};

template <number_like T>
inline T to_number(std::string_view s) {
    T ret{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
    if (ec == std::errc{} && ptr == s.data() + s.size()) return ret;
    throw InvalidArg("`" + std::string(s) + "` can't be converted to a number");
}

// Options of one command. Every option may be left out; bare words are collected as positionals.
class Parser {
  public:
    Parser() = default;
    Parser(const Parser &) = delete;
    Parser(Parser &&) noexcept = default;
    Parser &operator=(const Parser &) = delete;
    Parser &operator=(Parser &&) noexcept = default;

    // `name` must be unique, `short_name` may be 0
    void add(const std::string_view name, const char short_name, const std::string_view desc,
             std::size_t min_arg, std::size_t max_arg) {
        opts_.push_back({std::string{name}, short_name, std::string{desc}, min_arg, max_arg});
    }

    void set_positional(const std::string_view name, std::size_t min_cnt, std::size_t max_cnt) {
        pos_name_ = std::string{name};
        pos_min_ = min_cnt;
        pos_max_ = max_cnt;
    }

    void set_name(std::string_view name) { name_str_ = std::string{name}; }

    template <typename T>
    T get(std::string_view, const std::optional<T> & = std::nullopt) const = delete;
    template <number_like T>
    T get(std::string_view, const std::optional<T> & = std::nullopt) const;

    const strvec &positionals() const { return positionals_; }

    std::string usage() const {
        std::string s = "Usage: " + name_str_ + " [options]";
        if (!pos_name_.empty()) s += " <" + pos_name_ + ">";
        s += "\nOptions:\n";
        for (const auto &opt : opts_) {
            std::string head = "      ";
            if (opt.short_name) head = std::string{"  -"} + opt.short_name + ", ";
            head += "--" + opt.name;
            if (opt.max_cnt > 0) head += " <arg>";
            s += fmt::format(GRIDSCORE_FMT("{:<26}{}\n"), head, opt.desc);
        }
        return s;
    }

    [[noreturn]] void show_usage() const {
        std::cerr << usage();
        std::exit(1);
    }

    // `argv[0]` is the command itself.
    void parse_check(int argc, char **argv) {
        const strvec args(argv + 1, argv + argc);
        if (std::ranges::any_of(args, [](const std::string &a) {
                return a == "--help" || a == "-h" || a == "-?";
            })) {
            show_usage();
        }

        for (std::size_t i = 0; i < args.size(); i++) {
            const auto &arg = args[i];
            if (arg.empty()) throw InvalidArg("empty argument is invalid");
            if (arg[0] != '-') {
                if (positionals_.size() >= pos_max_) {
                    throw InvalidArg("unexpected token `" + arg + "`");
                }
                positionals_.emplace_back(arg);
                continue;
            }
            if (arg == "-" || arg == "--") throw InvalidArg("unexpected token `" + arg + "`");

            // `-jN`, `--jobs=N` carry their value inline
            const option *opt;
            std::optional<std::string> inline_value;
            if (arg[1] == '-') {
                const auto eq = arg.find('=');
                opt = &find_long(
                        std::string_view(arg).substr(2, eq == std::string::npos ? eq : eq - 2));
                if (eq != std::string::npos) inline_value = arg.substr(eq + 1);
            } else {
                opt = &find_short(arg[1]);
                if (arg.length() > 2) inline_value = arg.substr(2);
            }

            auto &vals = values_[opt->name];
            if (inline_value.has_value()) {
                vals.emplace_back(std::move(*inline_value));
            } else if (opt->max_cnt > 0 && i + 1 < args.size() &&
                       (args[i + 1].empty() || args[i + 1][0] != '-')) {
                vals.emplace_back(args[++i]);
            }
        }

        for (const auto &[name, vals] : values_) {
            const auto &opt = find_long(name);
            if (vals.size() < opt.min_cnt || vals.size() > opt.max_cnt) {
                throw InvalidArg(
                        fmt::format(GRIDSCORE_FMT("invalid number of argument for --{}, "
                                                  "expect [{},{}], got {}"),
                                    name, opt.min_cnt, opt.max_cnt, vals.size()));
            }
        }
        if (positionals_.size() < pos_min_) {
            throw ArgNotFound("missing argument <" + pos_name_ + ">");
        }
    }

  private:
    struct option {
        std::string name;
        char short_name;
        std::string desc;
        std::size_t min_cnt, max_cnt;
    };

    std::string name_str_;
    std::vector<option> opts_;
    std::map<std::string, strvec, std::less<>> values_;
    std::string pos_name_;
    std::size_t pos_min_{0}, pos_max_{0};
    strvec positionals_;

    const option &find_long(std::string_view s) const {
        auto it = std::ranges::find(opts_, s, &option::name);
        if (it == opts_.end()) throw NotExist("no such argument: --" + std::string(s));
        return *it;
    }
    const option &find_short(char c) const {
        auto it = std::ranges::find(opts_, c, &option::short_name);
        if (it == opts_.end()) throw NotExist(std::string("no such argument: -") + c);
        return *it;
    }

    // The one value given to `name`, nullptr if the option is absent.
    const std::string *single_value(std::string_view name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return nullptr;
        if (it->second.size() != 1) {
            throw InvalidArg(fmt::format(GRIDSCORE_FMT("expected 1 argument for --{}, got {}"),
                                         name, it->second.size()));
        }
        return &it->second.front();
    }
};

// whether the option was given at all
template <>
inline bool Parser::get<bool>(std::string_view name, const std::optional<bool> &) const {
    return values_.find(name) != values_.end();
}

template <>
inline std::string Parser::get<std::string>(std::string_view name,
                                            const std::optional<std::string> &default_value) const {
    if (const auto *v = single_value(name)) return *v;
    if (default_value.has_value()) return *default_value;
    throw ArgNotFound("missing argument --" + std::string(name));
}

template <number_like T>
inline T Parser::get(std::string_view name, const std::optional<T> &default_value) const {
    if (const auto *v = single_value(name)) return to_number<T>(*v);
    if (default_value.has_value()) return *default_value;
    throw ArgNotFound("missing argument --" + std::string(name));
}

class CommandBase {
  public:
    virtual ~CommandBase() = default;
    virtual std::string_view get_name() = 0;
    virtual std::string_view get_desc() = 0;
    virtual void init_parser() = 0;
    virtual int run() = 0;
    Parser parser;
};

class CommandHandler {
  public:
    void set_name(std::string_view name) { name_str_ = std::string{name}; }

    void add_command(std::unique_ptr<CommandBase> ptr) {
        ptr->init_parser();
        ptr->parser.set_name(name_str_ + " " + std::string{ptr->get_name()});
        cmd_vector_.emplace_back(std::move(ptr));
    }

    std::string usage() const {
        std::string s = "Usage: " + name_str_ + " <command> [options]\nCommands:\n";
        for (const auto &cmd : cmd_vector_) {
            s += fmt::format(GRIDSCORE_FMT("  {:<14}{}\n"), cmd->get_name(), cmd->get_desc());
        }
        return s;
    }

    [[noreturn]] void show_usage() const {
        std::cerr << usage();
        std::exit(1);
    }

    // Parses the options of the command named by `argv[1]` and returns what it returns.
    int run(int argc, char **argv) {
        if (argc <= 1) show_usage();
        const std::string_view name = argv[1];
        if (name == "--help" || name == "-h") show_usage();
        auto it = std::ranges::find_if(cmd_vector_, [&](const std::unique_ptr<CommandBase> &cmd) {
            return cmd->get_name() == name;
        });
        if (it == cmd_vector_.end()) {
            throw NotExist("unknown command `" + std::string{name} + "`");
        }
        (*it)->parser.parse_check(argc - 1, argv + 1);
        return (*it)->run();
    }

  private:
    std::string name_str_;
    std::vector<std::unique_ptr<CommandBase>> cmd_vector_;
};

}  // namespace gridscore::po
