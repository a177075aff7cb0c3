#include "aimgr/cli/commands.hpp"

int main(int argc, char **argv) { return aimgr::cli::run_cli(argc, argv); }
