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

#include "ByteCodeIterator.hpp"

#include <llvm/Support/FormatVariadic.h>

#include <algorithm>
#include <cassert>

#include <jmf/support/Bytes.hpp>
#include <jmf/support/Error.hpp>

namespace
{
using namespace jmf;

llvm::Error malformed(std::size_t offset, const llvm::Twine& message)
{
    return llvm::make_error<ByteCodeError>(offset, message.str());
}

// Switch instructions are padded so that their first operand starts at an offset divisible by 4.
std::size_t switchPadding(std::size_t offset)
{
    return 3 - (offset % 4);
}

llvm::Expected<std::uint64_t> tableSwitchSize(llvm::ArrayRef<char> code, std::size_t offset)
{
    std::size_t padding = switchPadding(offset);
    ByteReader reader(code.drop_front(std::min(code.size(), offset + 1 + padding)));
    reader.consume<std::int32_t>(); // default
    auto lowByte = reader.consume<std::int32_t>();
    auto highByte = reader.consume<std::int32_t>();
    if (reader.hasError())
    {
        return malformed(offset, "truncated tableswitch");
    }
    if (lowByte > highByte)
    {
        return malformed(offset, llvm::formatv("tableswitch low {0} is greater than high {1}", lowByte, highByte));
    }
    std::uint64_t jumpCount = static_cast<std::int64_t>(highByte) - lowByte + 1;
    return 1 + padding + 4 + 4 + 4 + jumpCount * 4;
}

llvm::Expected<std::uint64_t> lookupSwitchSize(llvm::ArrayRef<char> code, std::size_t offset)
{
    std::size_t padding = switchPadding(offset);
    ByteReader reader(code.drop_front(std::min(code.size(), offset + 1 + padding)));
    reader.consume<std::int32_t>(); // default
    auto pairCount = reader.consume<std::int32_t>();
    if (reader.hasError())
    {
        return malformed(offset, "truncated lookupswitch");
    }
    if (pairCount < 0)
    {
        return malformed(offset, llvm::formatv("lookupswitch has negative pair count {0}", pairCount));
    }
    return 1 + padding + 4 + 4 + 8 * static_cast<std::uint64_t>(pairCount);
}

llvm::Expected<std::uint64_t> wideSize(llvm::ArrayRef<char> code, std::size_t offset)
{
    if (offset + 1 >= code.size())
    {
        return malformed(offset, "wide without modified instruction");
    }
    auto modified = static_cast<OpCodes>(code[offset + 1]);
    switch (modified)
    {
        case OpCodes::IInc: return 6;
        case OpCodes::ILoad:
        case OpCodes::LLoad:
        case OpCodes::FLoad:
        case OpCodes::DLoad:
        case OpCodes::ALoad:
        case OpCodes::IStore:
        case OpCodes::LStore:
        case OpCodes::FStore:
        case OpCodes::DStore:
        case OpCodes::AStore:
        case OpCodes::Ret: return 4;
        default:
            return malformed(offset, llvm::formatv("wide cannot modify opcode {0:x2}",
                                                   static_cast<unsigned>(static_cast<std::uint8_t>(modified))));
    }
}

// Returns the size of the operation, including the identifying byte.
llvm::Expected<std::uint64_t> instructionSize(llvm::ArrayRef<char> code, std::size_t offset)
{
    auto opCode = static_cast<OpCodes>(code[offset]);
    std::uint64_t size = 0;
    switch (opCode)
    {
#define BYTECODE(name, code, fixedSize) \
    case OpCodes::name: size = (fixedSize); break;
#include "ByteCode.def"
        default:
            return malformed(offset, llvm::formatv("unknown opcode {0:x2}",
                                                   static_cast<unsigned>(static_cast<std::uint8_t>(opCode))));
    }
    if (size != 0)
    {
        return size;
    }

    switch (opCode)
    {
        case OpCodes::TableSwitch: return tableSwitchSize(code, offset);
        case OpCodes::LookupSwitch: return lookupSwitchSize(code, offset);
        case OpCodes::Wide: return wideSize(code, offset);
        default: llvm_unreachable("Only switches and wide have a variable size");
    }
}

} // namespace

llvm::StringRef jmf::getOpCodeName(OpCodes opCode)
{
    switch (opCode)
    {
#define BYTECODE(name, code, size) \
    case OpCodes::name: return #name;
#include "ByteCode.def"
    }
    return "<unknown>";
}

std::uint16_t jmf::ByteCodeOp::getPoolIndex() const
{
    assert(bytes.size() >= 3 && "instruction has no pool index operand");
    ByteReader reader(bytes.drop_front());
    return reader.consume<std::uint16_t>();
}

llvm::Expected<jmf::ByteCodeOp> jmf::decodeInstruction(llvm::ArrayRef<char> code, std::size_t offset)
{
    assert(offset < code.size());
    llvm::Expected<std::uint64_t> size = instructionSize(code, offset);
    if (!size)
    {
        return size.takeError();
    }
    if (*size > code.size() - offset)
    {
        return malformed(offset, llvm::formatv("{0} of {1} bytes exceeds code length {2}",
                                               getOpCodeName(static_cast<OpCodes>(code[offset])), *size,
                                               code.size()));
    }
    return ByteCodeOp{static_cast<OpCodes>(code[offset]), offset, code.slice(offset, *size)};
}

llvm::Error jmf::ByteCodeIterator::inc()
{
    std::size_t next = m_current.offset + m_current.size();
    if (next >= m_code.size())
    {
        *this = end(m_code);
        return llvm::Error::success();
    }
    llvm::Expected<ByteCodeOp> op = decodeInstruction(m_code, next);
    if (!op)
    {
        return op.takeError();
    }
    m_current = *op;
    return llvm::Error::success();
}

llvm::iterator_range<llvm::fallible_iterator<jmf::ByteCodeIterator>> jmf::byteCodeRange(llvm::ArrayRef<char> code,
                                                                                      llvm::Error& err)
{
    ByteCodeIterator end = ByteCodeIterator::end(code);
    if (code.empty())
    {
        return llvm::make_fallible_range(end, end, err);
    }

    llvm::Expected<ByteCodeOp> first = decodeInstruction(code, 0);
    if (!first)
    {
        llvm::ErrorAsOutParameter errorAsOutParameter(&err);
        err = first.takeError();
        return llvm::make_fallible_range(end, end, err);
    }
    return llvm::make_fallible_range(ByteCodeIterator(code, *first), end, err);
}
