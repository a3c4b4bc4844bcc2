#pragma once

namespace llmgate::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace llmgate::cli
