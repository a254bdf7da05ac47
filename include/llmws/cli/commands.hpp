#pragma once

namespace llmws::cli {

int run_cli(int argc, char **argv);

} // namespace llmws::cli
