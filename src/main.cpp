#include "nexarag/cli/commands.hpp"

int main(int argc, char **argv) { return nexarag::cli::run_cli(argc, argv); }
