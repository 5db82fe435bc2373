#pragma once

namespace warden::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace warden::cli
