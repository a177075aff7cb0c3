#pragma once

namespace aimgr::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace aimgr::cli
