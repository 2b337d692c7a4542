#pragma once

namespace talekeeper::cli {

int run_cli(int argc, char **argv);

} // namespace talekeeper::cli
