// Copyright (C) 2023 The jmf Contributors.
//
// This file is part of jmf.
//
// jmf is free software; you can redistribute it and/or modify it under  the terms of the GNU General Public License
// as published by the Free Software Foundation; either version 3, or (at your option) any later version.
//
// jmf is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
// of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License along with jmf; see the file LICENSE.txt.  If not
// see <http://www.gnu.org/licenses/>.

#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/fallible_iterator.h>
#include <llvm/ADT/iterator_range.h>
#include <llvm/Support/Error.h>

#include <cstdint>

namespace jmf
{
/// All JVM OpCodes that exist in version 17 with their identifying byte values.
/// https://docs.oracle.com/javase/specs/jvms/se17/html/jvms-6.html
enum class OpCodes : std::uint8_t
{
#define BYTECODE(name, code, size) name = (code),
#include "ByteCode.def"
};

/// Returns the name of 'opCode', e.g. "InvokeVirtual".
llvm::StringRef getOpCodeName(OpCodes opCode);

/// Returns true for the instructions calling a method through a 'Methodref' or 'InterfaceMethodref' operand:
/// 'invokevirtual', 'invokespecial', 'invokestatic' and 'invokeinterface'.
inline bool isMethodInvocation(OpCodes opCode)
{
    switch (opCode)
    {
        case OpCodes::InvokeVirtual:
        case OpCodes::InvokeSpecial:
        case OpCodes::InvokeStatic:
        case OpCodes::InvokeInterface: return true;
        default: return false;
    }
}

/// A single decoded JVM instruction.
struct ByteCodeOp
{
    OpCodes opCode{};
    /// Offset of the opcode byte within the code of the method.
    std::size_t offset{};
    /// All bytes of the instruction, starting with the opcode byte.
    llvm::ArrayRef<char> bytes;

    /// Returns the size of the instruction including the opcode byte.
    std::size_t size() const
    {
        return bytes.size();
    }

    /// Returns the 16 bit constant pool index directly following the opcode. Must only be called for instructions
    /// with such an operand, e.g. all invoke instructions.
    std::uint16_t getPoolIndex() const;
};

/// Decodes the instruction starting at 'offset' within 'code'.
/// Fails with a 'ByteCodeError' for unknown opcodes, invalid operands of variable sized instructions or if the
/// instruction would extend past the end of 'code'.
llvm::Expected<ByteCodeOp> decodeInstruction(llvm::ArrayRef<char> code, std::size_t offset);

/// Underlying iterator of 'byteCodeRange'. Every increment decodes the next instruction and may fail.
class ByteCodeIterator
{
    llvm::ArrayRef<char> m_code;
    ByteCodeOp m_current;

public:
    ByteCodeIterator() = default;

    ByteCodeIterator(llvm::ArrayRef<char> code, ByteCodeOp current) : m_code(code), m_current(current) {}

    /// Returns the past-the-end iterator of 'code'.
    static ByteCodeIterator end(llvm::ArrayRef<char> code)
    {
        return ByteCodeIterator(code, ByteCodeOp{OpCodes::Nop, code.size(), {}});
    }

    /// Advances to the next instruction.
    llvm::Error inc();

    const ByteCodeOp& operator*() const
    {
        return m_current;
    }

    const ByteCodeOp* operator->() const
    {
        return &m_current;
    }

    bool operator==(const ByteCodeIterator& rhs) const
    {
        return m_current.offset == rhs.m_current.offset;
    }

    /// Returns the current bytecode offset the iterator is at.
    std::size_t getOffset() const
    {
        return m_current.offset;
    }
};

/// Returns a range of every JVM instruction inside 'code'. Iteration stops early and sets 'err' if 'code' is
/// malformed. 'err' has to be checked after the loop:
///
///     llvm::Error err = llvm::Error::success();
///     for (const ByteCodeOp& op : byteCodeRange(code, err))
///     {
///         ...
///     }
///     if (err)
///     {
///         ...
///     }
llvm::iterator_range<llvm::fallible_iterator<ByteCodeIterator>> byteCodeRange(llvm::ArrayRef<char> code,
                                                                              llvm::Error& err);

} // namespace jmf
