//
// Copyright (c) 2024-2025 JLGxy
//

#include "cli.h"

int main(int argc, char **argv) {
    gridscore::cli::CliHandler handler;
    return handler.run(argc, argv);
}
