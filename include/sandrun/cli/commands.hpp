#pragma once

namespace sandrun::cli {

int run_cli(int argc, char **argv);

} // namespace sandrun::cli
