#pragma once

namespace toolexec::cli {

int run_cli(int argc, char **argv);

} // namespace toolexec::cli
