//
// Copyright (c) 2024-2025 JLGxy
//

#include "cli.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <memory>
#include <string>
#include <system_error>

#define FMT_ENFORCE_COMPILE_STRING 1

#include "config.h"
#include "fmt/core.h"
#include "grade_core.h"
#include "grade_logs.h"
#include "grader.h"
#include "report.h"
#include "settings.h"
#include "solution_registry.h"
#include "task_data.h"

namespace gridscore::cli {

int parse_task_id(const std::string_view s, int num_tasks) {
    int id = 0;
    bool valid = !s.empty() && std::ranges::all_of(s, [](unsigned char c) {
                     return std::isdigit(c) != 0;
                 });
    if (valid) {
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
        valid = ec == std::errc{} && ptr == s.data() + s.size() && id >= 1 && id <= num_tasks;
    }
    if (!valid) {
        throw po::InvalidArg(fmt::format(
                GRIDSCORE_FMT("\"{}\" is not a valid task number; you must input an integer "
                              "from 1 to {}"),
                s, num_tasks));
    }
    return id;
}

namespace {

void add_config_option(po::Parser &p) {
    p.add("config", 'c', "settings file (default: gridscore.yaml)", 1, 1);
}

settings_t settings_from(po::Parser &p) {
    const auto file = p.get<std::string>("config", std::string{});
    if (file.empty()) return load_settings(fs::path{_default_settings_file});
    if (!fs::is_regular_file(file)) throw ConfigError(file, "file not found");
    return load_settings(file);
}

class TaskCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "task"; }
    std::string_view get_desc() override { return "score one task and print its results"; }
    void init_parser() override {
        parser.set_positional("task-id", 1, 1);
        parser.add("verbose", 'v', "show the error of every crashed example", 0, 0);
        add_config_option(parser);
    }
    int run() override {
        const auto settings = settings_from(parser);
        const auto &conf = settings.grade;
        const int task_id = parse_task_id(parser.positionals().front(), conf.num_tasks);
        const bool verbose = parser.get<bool>("verbose");

        const CompiledRegistry registry(settings.solution_dir);
        const task_t task = load_task(settings.data_dir, task_id);
        const auto result =
                score_task(task, resolve_candidate(registry, task_id, conf), conf, true);

        if (result.is_function_not_found(conf)) {
            gl::prog.println(
                    GRIDSCORE_FMT("NameError: Function \"{}\" not found; the solution cannot be "
                                  "tested."),
                    conf.function_name);
            return 0;
        }

        gl::prog.println(GRIDSCORE_FMT("{}"), render_task_summary(task_id, result, conf, verbose));
        gl::prog.println(GRIDSCORE_FMT("===================={}===================="),
                         "VISUALIZATION");
        if (settings.visualize_single_task) {
            print_task_examples(task, &result);
        } else {
            gl::prog.println(GRIDSCORE_FMT("visualize_single_task is off in the settings file; "
                                           "examples are not printed."));
        }
        return 0;
    }
};

class AllCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "all"; }
    std::string_view get_desc() override { return "score every task and write the result logs"; }
    void init_parser() override {
        parser.add("verbose", 'v', "list the error of every crashed example in the log", 0, 0);
        parser.add("jobs", 'j', "number of tasks graded at once", 1, 1);
        add_config_option(parser);
    }
    int run() override {
        const auto settings = settings_from(parser);
        const auto &conf = settings.grade;
        const bool verbose = parser.get<bool>("verbose");
        const auto jobs = parser.get<std::size_t>("jobs", settings.jobs);
        if (jobs == 0) throw po::InvalidArg("--jobs must be at least 1");

        if (CompiledRegistry::count() == 0) {
            gl::print_warning("no solutions are compiled in; every task is unattempted");
        }
        const CompiledRegistry registry(settings.solution_dir);
        const BatchGrader grader(
                conf, registry, [&settings](int id) { return load_task(settings.data_dir, id); },
                jobs);
        const auto batch = grader.run();

        fs::create_directories(settings.logs_dir);
        const auto log_file = settings.logs_dir / _text_log_name;
        write_text_log(log_file, batch, conf, verbose);
        gl::prog.println(GRIDSCORE_FMT("Created results log at {}"), log_file.string());
        const auto excel_file = settings.logs_dir / _excel_log_name;
        write_excel(excel_file, batch, conf);
        gl::prog.println(GRIDSCORE_FMT("Created results excel sheet at {}"), excel_file.string());
        return 0;
    }
};

class ShowCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "show"; }
    std::string_view get_desc() override { return "print the examples of a task"; }
    void init_parser() override {
        parser.set_positional("task-id", 1, 1);
        add_config_option(parser);
    }
    int run() override {
        const auto settings = settings_from(parser);
        const int task_id = parse_task_id(parser.positionals().front(), settings.grade.num_tasks);
        print_task_examples(load_task(settings.data_dir, task_id), nullptr);
        return 0;
    }
};

class VersionCommand : public po::CommandBase {
  public:
    std::string_view get_name() override { return "version"; }
    std::string_view get_desc() override { return "print version"; }
    void init_parser() override {}
    int run() override {
        gl::prog.println(GRIDSCORE_FMT("gridscore version {} build {}"), GRIDSCORE_VERSION,
                         GRIDSCORE_VERSION_BUILD);
        return 0;
    }
};

}  // namespace

int CliHandler::run(int argc, char **argv) {
    try {
        return run_throw(argc, argv);
    } catch (po::OptionError &e) {
        gl::prog.println(GRIDSCORE_FMT("{}"), e.what());
        return 1;
    } catch (std::exception &e) {
        gl::prog.finish();
        gl::prog.println(GRIDSCORE_FMT("{}"), e.what());
        return 2;
    }
}

int CliHandler::run_throw(int argc, char **argv) {
    handler_.set_name("gridscore");
    handler_.add_command(std::make_unique<TaskCommand>());
    handler_.add_command(std::make_unique<AllCommand>());
    handler_.add_command(std::make_unique<ShowCommand>());
    handler_.add_command(std::make_unique<VersionCommand>());
    return handler_.run(argc, argv);
}

}  // namespace gridscore::cli
