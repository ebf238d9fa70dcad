#pragma once

#include <cstddef>
#include <string>

namespace stackvm::cli_detail {

struct CliOptions {
  std::string input_path = "-";
  std::string mode = "run";
  std::string out_path;
  std::size_t stack_limit = 1024;
  bool bytecode_input = false;
  bool check_vars = false;
  bool dump_state = false;
  bool trace = false;
};

CliOptions parse_cli_options(int argc, char** argv);

std::string usage();

}  // namespace stackvm::cli_detail
