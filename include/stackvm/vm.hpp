#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "stackvm/bytecode.hpp"
#include "stackvm/errors.hpp"

namespace stackvm {

enum class VMState {
  NotStarted,
  Running,
  Halted,
  Faulted,
};

const char* vm_state_name(VMState state);

struct StepResult {
  bool is_error = false;
  bool halted = false;
  Err err{ErrCode::InvalidOpcode, ""};
};

struct VMResult {
  bool is_error = false;
  Err err{ErrCode::InvalidOpcode, ""};
};

// Sparse word-addressed memory; unwritten addresses read as zero.
using Memory = std::map<std::int64_t, std::int64_t>;

class VM {
 public:
  // Throws std::invalid_argument when stack_limit is zero. PRINT writes to
  // `out`, which must outlive the VM.
  VM(Bytecode program, std::size_t stack_limit, std::ostream& out = std::cout);

  // Executes one instruction. After HALT or an error the VM is terminal and
  // further steps repeat the terminal outcome without side effects.
  StepResult execute_next();

  // Steps until HALT or the first error.
  VMResult run();

  const std::vector<std::int64_t>& stack() const { return stack_; }
  const Memory& memory() const { return memory_; }
  std::size_t pc() const { return pc_; }
  VMState state() const { return state_; }

  // Per-instruction trace lines go to `trace` when non-null.
  void set_trace(std::ostream* trace) { trace_ = trace; }

 private:
  StepResult fail(ErrCode code, const std::string& message, std::int64_t detail = 0);
  bool push(std::int64_t v);
  std::int64_t pop();
  bool valid_target(std::int64_t addr) const;

  Bytecode program_;
  std::size_t stack_limit_;
  std::ostream& out_;
  std::ostream* trace_ = nullptr;

  std::size_t pc_ = 0;
  std::vector<std::int64_t> stack_;
  Memory memory_;
  VMState state_ = VMState::NotStarted;
  Err last_err_{ErrCode::InvalidOpcode, ""};
};

}  // namespace stackvm
