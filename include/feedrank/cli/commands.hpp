#pragma once

namespace feedrank::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace feedrank::cli
