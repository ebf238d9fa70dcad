#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "stackvm/bytecode.hpp"
#include "stackvm/errors.hpp"
#include "stackvm/vm.hpp"

namespace {

using stackvm::Bytecode;
using stackvm::ErrCode;
using stackvm::Opcode;
using stackvm::VM;
using stackvm::VMResult;
using stackvm::VMState;

void op(Bytecode& code, Opcode o) { code.push_back(static_cast<std::uint8_t>(o)); }

void push(Bytecode& code, std::int64_t v) {
  op(code, Opcode::Push);
  stackvm::append_i64(code, v);
}

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

bool expect_err(const VMResult& out, ErrCode code, const std::string& msg) {
  if (!check(out.is_error, msg + " (expected error)")) return false;
  if (!check(out.err.code == code, msg + " (error code mismatch)")) return false;
  return true;
}

bool test_stack_underflow() {
  Bytecode p;
  push(p, 1);
  op(p, Opcode::Add);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  if (!expect_err(vm.run(), ErrCode::StackUnderflow, "ADD with one operand")) return false;
  if (!check(vm.stack() == std::vector<std::int64_t>{1}, "underflow leaves the stack untouched")) return false;

  Bytecode q;
  op(q, Opcode::Pop);
  VM vm2(q, 8, out);
  return expect_err(vm2.run(), ErrCode::StackUnderflow, "POP on empty stack");
}

bool test_stack_overflow_keeps_contents() {
  Bytecode p;
  push(p, 1);
  push(p, 2);
  push(p, 3);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 2, out);
  if (!expect_err(vm.run(), ErrCode::StackOverflow, "third push with capacity 2")) return false;
  if (!check(vm.stack() == std::vector<std::int64_t>{1, 2}, "stack keeps pre-push contents")) return false;
  return check(vm.state() == VMState::Faulted, "overflow faults the VM");
}

bool test_division_by_zero() {
  Bytecode p;
  push(p, 5);
  push(p, 10);
  push(p, 0);
  op(p, Opcode::Div);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  if (!expect_err(vm.run(), ErrCode::ZeroDiv, "10 / 0")) return false;
  return check(vm.stack() == std::vector<std::int64_t>{5}, "only the two operands were popped");
}

bool test_invalid_opcode() {
  Bytecode p;
  push(p, 1);
  p.push_back(0x42);
  std::ostringstream out;
  VM vm(p, 8, out);
  const VMResult r = vm.run();
  if (!expect_err(r, ErrCode::InvalidOpcode, "byte 0x42")) return false;
  if (!check(r.err.detail == 0x42, "error carries the offending byte")) return false;
  return check(r.err.message == "invalid opcode 0x42 at offset 9", "invalid opcode message: " + r.err.message);
}

bool test_truncated_operand() {
  Bytecode p = {static_cast<std::uint8_t>(Opcode::Push), 1, 2, 3};
  std::ostringstream out;
  VM vm(p, 8, out);
  return expect_err(vm.run(), ErrCode::InvalidOpcode, "PUSH with 3 operand bytes");
}

bool test_missing_halt() {
  Bytecode p;
  push(p, 1);
  std::ostringstream out;
  VM vm(p, 8, out);
  return expect_err(vm.run(), ErrCode::InvalidOpcode, "running past the end of the program");
}

bool test_jump_target_out_of_range() {
  Bytecode p;
  push(p, 99);
  op(p, Opcode::Jump);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  const VMResult r = vm.run();
  if (!expect_err(r, ErrCode::OutOfMemory, "jump past end")) return false;
  if (!check(r.err.detail == 99, "error carries the offending address")) return false;

  Bytecode q;
  push(q, -1);
  op(q, Opcode::Jump);
  op(q, Opcode::Halt);
  VM vm2(q, 8, out);
  return expect_err(vm2.run(), ErrCode::OutOfMemory, "negative jump target");
}

bool test_conditional_jump() {
  // Untaken branch ignores an out-of-range target.
  Bytecode p;
  push(p, 0);
  push(p, 1000);
  op(p, Opcode::JumpIf);
  push(p, 7);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  if (!check(!vm.run().is_error, "untaken JMP_IF falls through")) return false;
  if (!check(vm.stack() == std::vector<std::int64_t>{7}, "fallthrough result")) return false;

  Bytecode q;
  push(q, -3);
  push(q, 1000);
  op(q, Opcode::JumpIf);
  op(q, Opcode::Halt);
  VM vm2(q, 8, out);
  if (!expect_err(vm2.run(), ErrCode::OutOfMemory, "taken JMP_IF validates target")) return false;

  Bytecode t;
  push(t, 1);
  push(t, 29);
  op(t, Opcode::JumpIf);  // offset 18
  push(t, 111);           // offset 19, skipped
  op(t, Opcode::Pop);     // offset 28, skipped
  op(t, Opcode::Halt);    // offset 29
  VM vm3(t, 8, out);
  if (!check(!vm3.run().is_error, "taken JMP_IF")) return false;
  return check(vm3.stack().empty(), "taken JMP_IF skipped the push");
}

bool test_negative_memory_address() {
  Bytecode p;
  push(p, 5);
  push(p, -4);
  op(p, Opcode::Store);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  const VMResult r = vm.run();
  if (!expect_err(r, ErrCode::OutOfMemory, "negative store address")) return false;
  return check(r.err.detail == -4 && vm.memory().empty(), "nothing written");
}

bool test_wrapping_arithmetic() {
  const std::int64_t max = std::numeric_limits<std::int64_t>::max();
  const std::int64_t min = std::numeric_limits<std::int64_t>::min();
  Bytecode p;
  push(p, max);
  push(p, 1);
  op(p, Opcode::Add);
  push(p, min);
  push(p, -1);
  op(p, Opcode::Div);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  if (!check(!vm.run().is_error, "overflowing arithmetic is not fatal")) return false;
  return check(vm.stack() == std::vector<std::int64_t>{min, min}, "two's complement wrap");
}

bool test_faulted_vm_is_terminal() {
  Bytecode p;
  op(p, Opcode::Pop);
  op(p, Opcode::Halt);
  std::ostringstream out;
  VM vm(p, 8, out);
  if (!expect_err(vm.run(), ErrCode::StackUnderflow, "first run")) return false;
  const stackvm::StepResult s = vm.execute_next();
  if (!check(s.is_error && s.err.code == ErrCode::StackUnderflow, "step after fault repeats the error")) return false;
  return check(vm.pc() == 1, "no further progress after a fault");
}

bool test_zero_stack_limit_rejected() {
  try {
    VM vm(Bytecode{static_cast<std::uint8_t>(Opcode::Halt)}, 0);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return check(false, "stack limit 0 must throw");
}

}  // namespace

int main() {
  if (!test_stack_underflow()) return 1;
  if (!test_stack_overflow_keeps_contents()) return 1;
  if (!test_division_by_zero()) return 1;
  if (!test_invalid_opcode()) return 1;
  if (!test_truncated_operand()) return 1;
  if (!test_missing_halt()) return 1;
  if (!test_jump_target_out_of_range()) return 1;
  if (!test_conditional_jump()) return 1;
  if (!test_negative_memory_address()) return 1;
  if (!test_wrapping_arithmetic()) return 1;
  if (!test_faulted_vm_is_terminal()) return 1;
  if (!test_zero_stack_limit_rejected()) return 1;
  std::cout << "stackvm_test_vm_edges: OK\n";
  return 0;
}
