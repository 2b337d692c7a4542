#include "talekeeper/cli/commands.hpp"

int main(int argc, char **argv) { return talekeeper::cli::run_cli(argc, argv); }
