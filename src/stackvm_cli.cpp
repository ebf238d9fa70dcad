#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "stackvm/ast.hpp"
#include "stackvm/bytecode.hpp"
#include "stackvm/errors.hpp"
#include "stackvm/parser.hpp"
#include "stackvm/pipeline.hpp"
#include "stackvm/vm.hpp"
#include "stackvm_cli/options.hpp"

namespace {

using stackvm::Bytecode;
using stackvm::Err;
using stackvm::cli_detail::CliOptions;

std::string read_input(const std::string& path) {
  if (path == "-") {
    std::stringstream buf;
    buf << std::cin.rdbuf();
    return buf.str();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

void write_output(const std::string& path, const Bytecode& code) {
  if (path.empty()) {
    std::cout.write(reinterpret_cast<const char*>(code.data()), static_cast<std::streamsize>(code.size()));
    return;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("cannot open " + path + " for writing");
  }
  out.write(reinterpret_cast<const char*>(code.data()), static_cast<std::streamsize>(code.size()));
  if (!out) {
    throw std::runtime_error("failed writing " + path);
  }
}

int report(const Err& err) {
  std::cout << "ERR " << stackvm::err_code_name(err.code) << "\n";
  if (!err.message.empty()) {
    std::cout << "MSG " << err.message << "\n";
  }
  return 1;
}

void dump_state(const stackvm::VM& vm) {
  std::cout << "STACK";
  for (const std::int64_t v : vm.stack()) {
    std::cout << " " << v;
  }
  std::cout << "\n";
  for (const auto& entry : vm.memory()) {
    std::cout << "MEM " << entry.first << " " << entry.second << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  try {
    const CliOptions opts = stackvm::cli_detail::parse_cli_options(argc, argv);
    const std::string text = read_input(opts.input_path);

    if (opts.mode == "ast") {
      const stackvm::ParseResult parsed = stackvm::parse_program(text);
      if (parsed.is_error) {
        return report(parsed.err);
      }
      std::cout << stackvm::ast_to_string(parsed.program) << "\n";
      return 0;
    }

    Bytecode code;
    if (opts.bytecode_input) {
      code.assign(text.begin(), text.end());
    } else {
      stackvm::CompileResult compiled = stackvm::compile_source(text, opts.check_vars);
      if (compiled.is_error) {
        return report(compiled.err);
      }
      code = std::move(compiled.code);
    }

    if (opts.mode == "disasm") {
      std::cout << stackvm::disassemble(code);
      return 0;
    }
    if (opts.mode == "emit") {
      write_output(opts.out_path, code);
      return 0;
    }

    stackvm::VM vm(std::move(code), opts.stack_limit, std::cout);
    if (opts.trace) {
      vm.set_trace(&std::cerr);
    }
    const stackvm::VMResult result = vm.run();
    if (result.is_error) {
      const int rc = report(result.err);
      if (opts.dump_state) {
        dump_state(vm);
      }
      return rc;
    }
    if (opts.dump_state) {
      std::cout << "OK " << stackvm::vm_state_name(vm.state()) << "\n";
      dump_state(vm);
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "stackvm: " << e.what() << "\n" << stackvm::cli_detail::usage();
    return 2;
  }
}
