#include "toolexec/cli/commands.hpp"

int main(int argc, char **argv) { return toolexec::cli::run_cli(argc, argv); }
