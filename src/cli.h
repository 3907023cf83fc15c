//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <string_view>

#include "prog_option.h"

namespace gridscore::cli {

// Accepts decimal digits only (leading zeros allowed) and a value in [1, num_tasks].
// Throws po::InvalidArg otherwise.
int parse_task_id(std::string_view s, int num_tasks);

class CliHandler {
  public:
    int run(int argc, char **argv);

  private:
    po::CommandHandler handler_;

    int run_throw(int argc, char **argv);
};

}  // namespace gridscore::cli
