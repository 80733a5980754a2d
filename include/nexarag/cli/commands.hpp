#pragma once

namespace nexarag::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace nexarag::cli
