#include "ls8/engine.hpp"

#include "ls8/errors.hpp"
#include "ls8/trace.hpp"

#include <iostream>

namespace ls8 {

namespace {

// Engine-derived addresses live on an 8-bit bus.
std::uint8_t wrapAddress(unsigned address) {
    return static_cast<std::uint8_t>(address & 0xFF);
}

} // namespace

struct ExecutionEngine::Handlers {
    static void hlt(ExecutionEngine& e, std::uint8_t, std::uint8_t) {
        e.state_ = RunState::Halted;
    }

    static void ldi(ExecutionEngine& e, std::uint8_t a, std::uint8_t b) {
        e.registers_.set(a, b);
    }

    static void prn(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        e.output() << static_cast<int>(e.registers_.get(a)) << '\n';
    }

    static void add(ExecutionEngine& e, std::uint8_t a, std::uint8_t b) { e.alu_.execute(AluOp::Add, a, b); }
    static void sub(ExecutionEngine& e, std::uint8_t a, std::uint8_t b) { e.alu_.execute(AluOp::Sub, a, b); }
    static void mul(ExecutionEngine& e, std::uint8_t a, std::uint8_t b) { e.alu_.execute(AluOp::Mul, a, b); }
    static void inc(ExecutionEngine& e, std::uint8_t a, std::uint8_t) { e.alu_.execute(AluOp::Inc, a); }
    static void dec(ExecutionEngine& e, std::uint8_t a, std::uint8_t) { e.alu_.execute(AluOp::Dec, a); }
    static void cmp(ExecutionEngine& e, std::uint8_t a, std::uint8_t b) { e.alu_.execute(AluOp::Cmp, a, b); }

    static void push(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        e.pushByte(e.registers_.get(a));
    }

    static void pop(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        const std::uint8_t value = e.popByte();
        e.registers_.set(a, value);
    }

    static void call(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        e.pushByte(wrapAddress(e.pc_ + 2u));
        e.jumpTo(e.registers_.get(a));
    }

    static void ret(ExecutionEngine& e, std::uint8_t, std::uint8_t) {
        e.jumpTo(e.popByte());
    }

    static void jmp(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        e.jumpTo(e.registers_.get(a));
    }

    static void jeq(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        if (e.flag_ == CompareFlag::Equal) {
            e.jumpTo(e.registers_.get(a));
        } else {
            e.jumpTo(wrapAddress(e.pc_ + 2u));
        }
    }

    static void jne(ExecutionEngine& e, std::uint8_t a, std::uint8_t) {
        if (e.flag_ != CompareFlag::Equal) {
            e.jumpTo(e.registers_.get(a));
        } else {
            e.jumpTo(wrapAddress(e.pc_ + 2u));
        }
    }
};

const InstructionTable& ExecutionEngine::instructionTable() {
    static const InstructionTable table = [] {
        InstructionTable t;
        t.registerInstruction(OpCode::Hlt, "HLT", 0, &Handlers::hlt);
        t.registerInstruction(OpCode::Ldi, "LDI", 2, &Handlers::ldi);
        t.registerInstruction(OpCode::Prn, "PRN", 1, &Handlers::prn);
        t.registerInstruction(OpCode::Add, "ADD", 2, &Handlers::add);
        t.registerInstruction(OpCode::Sub, "SUB", 2, &Handlers::sub);
        t.registerInstruction(OpCode::Mul, "MUL", 2, &Handlers::mul);
        t.registerInstruction(OpCode::Inc, "INC", 1, &Handlers::inc);
        t.registerInstruction(OpCode::Dec, "DEC", 1, &Handlers::dec);
        t.registerInstruction(OpCode::Push, "PUSH", 1, &Handlers::push);
        t.registerInstruction(OpCode::Pop, "POP", 1, &Handlers::pop);
        t.registerInstruction(OpCode::Call, "CALL", 1, &Handlers::call);
        t.registerInstruction(OpCode::Ret, "RET", 0, &Handlers::ret);
        t.registerInstruction(OpCode::Cmp, "CMP", 2, &Handlers::cmp);
        t.registerInstruction(OpCode::Jmp, "JMP", 1, &Handlers::jmp);
        t.registerInstruction(OpCode::Jeq, "JEQ", 1, &Handlers::jeq);
        t.registerInstruction(OpCode::Jne, "JNE", 1, &Handlers::jne);
        return t;
    }();
    return table;
}

ExecutionEngine::ExecutionEngine(EngineConfig config)
    : config_(config),
      registers_(config.initialStackPointer),
      alu_(registers_, flag_) {}

void ExecutionEngine::load(const std::vector<std::uint8_t>& program) {
    if (program.size() > Memory::kSize) {
        throw ProgramTooLarge(program.size());
    }
    memory_.clear();
    for (std::size_t address = 0; address < program.size(); ++address) {
        memory_.write(address, program[address]);
    }
    registers_.reset(config_.initialStackPointer);
    flag_.reset();
    pc_ = 0;
    pcWritten_ = false;
    instructionCount_ = 0;
    state_ = RunState::Running;
}

bool ExecutionEngine::step() {
    if (state_ != RunState::Running) {
        return false;
    }
    try {
        execute();
    } catch (const Ls8Error&) {
        state_ = RunState::Halted;
        throw;
    }
    return state_ == RunState::Running;
}

void ExecutionEngine::runToHalt() {
    while (step()) {
    }
}

void ExecutionEngine::execute() {
    const std::uint8_t opcode = memory_.read(pc_);
    // Always pre-fetch two operand bytes; the handler only sees the ones its
    // instruction declares.
    const std::uint8_t fetchedA = memory_.read(wrapAddress(pc_ + 1u));
    const std::uint8_t fetchedB = memory_.read(wrapAddress(pc_ + 2u));

    if (config_.trace) {
        writeTrace(*config_.trace, pc_, memory_, registers_);
    }

    const InstructionInfo& info = instructionTable().lookup(opcode, pc_);
    const std::uint8_t operandA = info.operandCount >= 1 ? fetchedA : 0;
    const std::uint8_t operandB = info.operandCount >= 2 ? fetchedB : 0;

    pcWritten_ = false;
    info.handler(*this, operandA, operandB);
    if (!pcWritten_) {
        pc_ = wrapAddress(pc_ + 1u + info.operandCount);
    }
    ++instructionCount_;
}

void ExecutionEngine::jumpTo(std::uint8_t address) {
    pc_ = address;
    pcWritten_ = true;
}

void ExecutionEngine::pushByte(std::uint8_t value) {
    registers_.setSp(registers_.sp() - 1);
    memory_.write(registers_.sp(), value);
}

std::uint8_t ExecutionEngine::popByte() {
    const std::uint8_t value = memory_.read(registers_.sp());
    registers_.setSp(registers_.sp() + 1);
    return value;
}

std::ostream& ExecutionEngine::output() const {
    return config_.output ? *config_.output : std::cout;
}

} // namespace ls8
