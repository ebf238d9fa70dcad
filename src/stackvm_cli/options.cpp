#include "options.hpp"

#include <stdexcept>

namespace stackvm::cli_detail {

CliOptions parse_cli_options(int argc, char** argv) {
  CliOptions opts;
  bool have_input = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto need_value = [&](const char* key) -> std::string {
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string("missing value for ") + key);
      }
      return argv[++i];
    };

    if (arg == "--stack-limit") {
      const std::string raw = need_value("--stack-limit");
      long long value = 0;
      try {
        value = std::stoll(raw);
      } catch (const std::exception&) {
        throw std::runtime_error("invalid --stack-limit");
      }
      if (value <= 0) {
        throw std::runtime_error("invalid --stack-limit");
      }
      opts.stack_limit = static_cast<std::size_t>(value);
    } else if (arg == "--mode") {
      opts.mode = need_value("--mode");
    } else if (arg == "--out") {
      opts.out_path = need_value("--out");
    } else if (arg == "--bytecode") {
      opts.bytecode_input = true;
    } else if (arg == "--check-vars") {
      opts.check_vars = true;
    } else if (arg == "--dump-state") {
      opts.dump_state = true;
    } else if (arg == "--trace") {
      opts.trace = true;
    } else if (arg == "-" || arg.rfind("--", 0) != 0) {
      if (have_input) {
        throw std::runtime_error("more than one input path");
      }
      opts.input_path = arg;
      have_input = true;
    } else {
      throw std::runtime_error("unknown argument: " + arg);
    }
  }

  if (opts.mode != "run" && opts.mode != "ast" && opts.mode != "disasm" && opts.mode != "emit") {
    throw std::runtime_error("--mode must be one of: run|ast|disasm|emit");
  }
  if (opts.mode == "ast" && opts.bytecode_input) {
    throw std::runtime_error("--mode ast needs source input");
  }
  return opts;
}

std::string usage() {
  return "usage: stackvm [<path>|-] [--mode run|ast|disasm|emit] [--out PATH] [--bytecode]\n"
         "               [--stack-limit N] [--check-vars] [--dump-state] [--trace]\n";
}

}  // namespace stackvm::cli_detail
