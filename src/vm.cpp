#include "stackvm/vm.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace stackvm {

namespace {

// Signed overflow wraps in two's complement instead of being undefined.
std::int64_t wrap_add(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}

std::int64_t wrap_sub(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}

std::int64_t wrap_mul(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}

std::int64_t trunc_div(std::int64_t a, std::int64_t b) {
  if (a == std::numeric_limits<std::int64_t>::min() && b == -1) {
    return a;
  }
  return a / b;
}

std::string hex_byte(std::uint8_t b) {
  std::ostringstream out;
  out << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return out.str();
}

}  // namespace

const char* vm_state_name(VMState state) {
  switch (state) {
    case VMState::NotStarted:
      return "not-started";
    case VMState::Running:
      return "running";
    case VMState::Halted:
      return "halted";
    case VMState::Faulted:
      return "faulted";
  }
  return "faulted";
}

VM::VM(Bytecode program, std::size_t stack_limit, std::ostream& out)
    : program_(std::move(program)), stack_limit_(stack_limit), out_(out) {
  if (stack_limit_ == 0) {
    throw std::invalid_argument("stack limit must be positive");
  }
  stack_.reserve(stack_limit_ < 1024 ? stack_limit_ : 1024);
}

StepResult VM::fail(ErrCode code, const std::string& message, std::int64_t detail) {
  state_ = VMState::Faulted;
  last_err_ = Err{code, message, detail};
  StepResult out;
  out.is_error = true;
  out.err = last_err_;
  return out;
}

bool VM::push(std::int64_t v) {
  if (stack_.size() >= stack_limit_) {
    return false;
  }
  stack_.push_back(v);
  return true;
}

std::int64_t VM::pop() {
  const std::int64_t v = stack_.back();
  stack_.pop_back();
  return v;
}

bool VM::valid_target(std::int64_t addr) const {
  return addr >= 0 && static_cast<std::uint64_t>(addr) < program_.size();
}

StepResult VM::execute_next() {
  if (state_ == VMState::Halted) {
    StepResult out;
    out.halted = true;
    return out;
  }
  if (state_ == VMState::Faulted) {
    StepResult out;
    out.is_error = true;
    out.err = last_err_;
    return out;
  }
  state_ = VMState::Running;

  if (pc_ >= program_.size()) {
    return fail(ErrCode::InvalidOpcode, "program counter past end of bytecode", 0);
  }

  const std::size_t at = pc_;
  const std::uint8_t byte = program_[pc_];
  Opcode op = Opcode::Halt;
  if (!opcode_from_byte(byte, op)) {
    return fail(ErrCode::InvalidOpcode, "invalid opcode " + hex_byte(byte) + " at offset " + std::to_string(at),
                byte);
  }
  pc_ += 1;

  std::int64_t operand = 0;
  if (has_operand(op)) {
    if (pc_ + kOperandSize > program_.size()) {
      return fail(ErrCode::InvalidOpcode, "truncated operand at offset " + std::to_string(at), byte);
    }
    operand = read_i64(program_, pc_);
    pc_ += kOperandSize;
  }

  if (trace_ != nullptr) {
    *trace_ << "TRACE " << at << " " << opcode_name(op);
    if (has_operand(op)) {
      *trace_ << " " << operand;
    }
    *trace_ << " depth=" << stack_.size() << "\n";
  }

  StepResult out;
  switch (op) {
    case Opcode::Push:
      if (!push(operand)) {
        return fail(ErrCode::StackOverflow, "stack overflow");
      }
      return out;

    case Opcode::Pop:
      if (stack_.empty()) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      pop();
      return out;

    case Opcode::Add:
    case Opcode::Sub:
    case Opcode::Mul:
    case Opcode::Div:
    case Opcode::Equal:
    case Opcode::Less:
    case Opcode::LessEqual:
    case Opcode::GreaterEqual: {
      if (stack_.size() < 2) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      const std::int64_t b = pop();
      const std::int64_t a = pop();
      std::int64_t r = 0;
      if (op == Opcode::Add) r = wrap_add(a, b);
      else if (op == Opcode::Sub) r = wrap_sub(a, b);
      else if (op == Opcode::Mul) r = wrap_mul(a, b);
      else if (op == Opcode::Div) {
        if (b == 0) {
          return fail(ErrCode::ZeroDiv, "division by zero");
        }
        r = trunc_div(a, b);
      } else if (op == Opcode::Equal) r = (a == b) ? 1 : 0;
      else if (op == Opcode::Less) r = (a < b) ? 1 : 0;
      else if (op == Opcode::LessEqual) r = (a <= b) ? 1 : 0;
      else r = (a >= b) ? 1 : 0;
      stack_.push_back(r);  // two slots were just freed
      return out;
    }

    case Opcode::Load: {
      if (stack_.empty()) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      const std::int64_t addr = pop();
      if (addr < 0) {
        return fail(ErrCode::OutOfMemory, "invalid memory address " + std::to_string(addr), addr);
      }
      auto it = memory_.find(addr);
      stack_.push_back(it == memory_.end() ? 0 : it->second);
      return out;
    }

    case Opcode::Store: {
      // Stack layout: ..., value, address
      if (stack_.size() < 2) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      const std::int64_t addr = pop();
      const std::int64_t value = pop();
      if (addr < 0) {
        return fail(ErrCode::OutOfMemory, "invalid memory address " + std::to_string(addr), addr);
      }
      memory_[addr] = value;
      return out;
    }

    case Opcode::Jump: {
      if (stack_.empty()) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      const std::int64_t target = pop();
      if (!valid_target(target)) {
        return fail(ErrCode::OutOfMemory, "jump target out of range: " + std::to_string(target), target);
      }
      pc_ = static_cast<std::size_t>(target);
      return out;
    }

    case Opcode::JumpIf: {
      // Stack layout: ..., condition, target
      if (stack_.size() < 2) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      const std::int64_t target = pop();
      const std::int64_t cond = pop();
      if (cond != 0) {
        if (!valid_target(target)) {
          return fail(ErrCode::OutOfMemory, "jump target out of range: " + std::to_string(target), target);
        }
        pc_ = static_cast<std::size_t>(target);
      }
      return out;
    }

    case Opcode::Print:
      if (stack_.empty()) {
        return fail(ErrCode::StackUnderflow, "stack underflow");
      }
      out_ << "Output: " << pop() << "\n";
      return out;

    case Opcode::Halt:
      state_ = VMState::Halted;
      out.halted = true;
      return out;
  }

  return fail(ErrCode::InvalidOpcode, "unhandled opcode", byte);
}

VMResult VM::run() {
  VMResult result;
  while (true) {
    const StepResult step = execute_next();
    if (step.is_error) {
      result.is_error = true;
      result.err = step.err;
      return result;
    }
    if (step.halted) {
      return result;
    }
  }
}

}  // namespace stackvm
