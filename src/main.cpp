#include "chronicle/cli/commands.hpp"

int main(int argc, char **argv) { return chronicle::cli::run_cli(argc, argv); }
