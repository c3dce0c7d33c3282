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

#include "ConstantPool.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/FormatVariadic.h>

#include <algorithm>

#define DEBUG_TYPE "jmf-class"

using namespace jmf;

namespace
{

std::uint8_t deduceByteCount(std::uint8_t c)
{
    if (c <= 0x7F)
    {
        return 1;
    }
    if ((c & 0xE0) == 0b11000000)
    {
        return 2;
    }
    if ((c & 0xF0) == 0b11100000)
    {
        return 3;
    }
    // Not a valid lead byte in modified UTF-8. Copied verbatim.
    return 0;
}

bool isContinuation(std::uint8_t c)
{
    return (c & 0xC0) == 0x80;
}

/// Converts the modified UTF-8 used by class files to standard UTF-8. The differences are the two byte encoding of
/// the null character and surrogate pairs being encoded as two three byte sequences. Anything malformed is copied
/// byte by byte.
std::string toUTF8(llvm::StringRef rawString)
{
    std::string result;
    result.reserve(rawString.size());
    const auto* iter = rawString.bytes_begin();
    const auto* end = rawString.bytes_end();
    while (iter != end)
    {
        std::uint8_t firstByte = *iter;
        std::uint8_t count = deduceByteCount(firstByte);
        if (count == 0 || end - iter < count
            || !std::all_of(iter + 1, iter + count, [](std::uint8_t c) { return isContinuation(c); }))
        {
            result.push_back(static_cast<char>(firstByte));
            iter++;
            continue;
        }

        switch (count)
        {
            case 1: break;
            case 2:
                // Modified UTF-8 encodes the null character as 0xC0 0x80.
                if (firstByte == 0xC0 && iter[1] == 0x80)
                {
                    result.push_back(0);
                    iter += 2;
                    continue;
                }
                break;
            case 3:
            {
                std::uint8_t v = iter[1];
                // High surrogate followed by a low surrogate.
                if (firstByte == 0xED && (v & 0xF0) == 0xA0 && end - iter >= 6 && iter[3] == 0xED
                    && (iter[4] & 0xF0) == 0xB0 && isContinuation(iter[5]))
                {
                    std::uint8_t w = iter[2];
                    std::uint8_t y = iter[4];
                    std::uint8_t z = iter[5];
                    std::uint32_t codepoint =
                        0x10000 + ((v & 0x0f) << 16) + ((w & 0x3f) << 10) + ((y & 0x0f) << 6) + (z & 0x3f);
                    result.push_back(static_cast<char>((0b11110 << 3) | ((codepoint >> 18) & 0x7)));
                    result.push_back(static_cast<char>((0b10 << 6) | ((codepoint >> 12) & 0x3F)));
                    result.push_back(static_cast<char>((0b10 << 6) | ((codepoint >> 6) & 0x3F)));
                    result.push_back(static_cast<char>((0b10 << 6) | (codepoint & 0x3F)));
                    iter += 6;
                    continue;
                }
                break;
            }
            default: llvm_unreachable("deduceByteCount only returns 0 to 3");
        }
        result.append(iter, iter + count);
        iter += count;
    }
    return result;
}

llvm::Expected<ConstantPoolInfo> parseConstantPoolInfo(ByteReader& reader, llvm::StringSaver& stringSaver,
                                                       std::uint16_t index)
{
    auto tag = reader.consume<ConstantPoolTag>();
    if (reader.hasError())
    {
        return reader.takeError();
    }
    switch (tag)
    {
        case ConstantPoolTag::Class: return ClassInfo{reader.consume<std::uint16_t>()};
        case ConstantPoolTag::FieldRef:
        {
            auto classIndex = reader.consume<std::uint16_t>();
            return FieldRefInfo{{classIndex, reader.consume<std::uint16_t>()}};
        }
        case ConstantPoolTag::MethodRef:
        {
            auto classIndex = reader.consume<std::uint16_t>();
            return MethodRefInfo{{classIndex, reader.consume<std::uint16_t>()}};
        }
        case ConstantPoolTag::InterfaceMethodRef:
        {
            auto classIndex = reader.consume<std::uint16_t>();
            return InterfaceMethodRefInfo{{classIndex, reader.consume<std::uint16_t>()}};
        }
        case ConstantPoolTag::String: return StringInfo{reader.consume<std::uint16_t>()};
        case ConstantPoolTag::Integer: return IntegerInfo{reader.consume<std::int32_t>()};
        case ConstantPoolTag::Float: return FloatInfo{reader.consume<float>()};
        case ConstantPoolTag::Long: return LongInfo{reader.consume<std::int64_t>()};
        case ConstantPoolTag::Double: return DoubleInfo{reader.consume<double>()};
        case ConstantPoolTag::NameAndType:
        {
            auto nameIndex = reader.consume<std::uint16_t>();
            return NameAndTypeInfo{nameIndex, reader.consume<std::uint16_t>()};
        }
        case ConstantPoolTag::Utf8:
        {
            auto length = reader.consume<std::uint16_t>();
            llvm::StringRef rawString = reader.consumeString(length);
            return Utf8Info{stringSaver.save(toUTF8(rawString))};
        }
        case ConstantPoolTag::MethodHandle:
        {
            auto kind = reader.consume<std::uint8_t>();
            return MethodHandleInfo{kind, reader.consume<std::uint16_t>()};
        }
        case ConstantPoolTag::MethodType: return MethodTypeInfo{reader.consume<std::uint16_t>()};
        case ConstantPoolTag::Dynamic:
        {
            auto bootStrapMethodIndex = reader.consume<std::uint16_t>();
            return DynamicInfo{bootStrapMethodIndex, reader.consume<std::uint16_t>()};
        }
        case ConstantPoolTag::InvokeDynamic:
        {
            auto bootStrapMethodIndex = reader.consume<std::uint16_t>();
            return InvokeDynamicInfo{bootStrapMethodIndex, reader.consume<std::uint16_t>()};
        }
        case ConstantPoolTag::Module: return ModuleInfo{reader.consume<std::uint16_t>()};
        case ConstantPoolTag::Package: return PackageInfo{reader.consume<std::uint16_t>()};
    }
    return llvm::make_error<ClassFileError>(
        ClassFileError::InvalidConstantTag,
        llvm::formatv("tag {0} at index {1}", static_cast<unsigned>(tag), index).str());
}

} // namespace

llvm::Expected<ConstantPool> jmf::ConstantPool::parse(ByteReader& reader, llvm::StringSaver& stringSaver)
{
    ConstantPool result;

    auto count = reader.consume<std::uint16_t>();
    if (reader.hasError())
    {
        return reader.takeError();
    }
    result.m_entries.resize(std::max<std::size_t>(count, 1));
    for (std::size_t i = 1; i < count; i++)
    {
        llvm::Expected<ConstantPoolInfo> info = parseConstantPoolInfo(reader, stringSaver, static_cast<std::uint16_t>(i));
        if (!info)
        {
            return info.takeError();
        }
        // Payload reads of the entry itself may have run out of bytes.
        if (reader.hasError())
        {
            return reader.takeError();
        }
        result.m_entries[i] = std::move(*info);
        if (holdsAnyOf<LongInfo, DoubleInfo>(result.m_entries[i]))
        {
            // The next slot stays a 'std::monostate'.
            i++;
        }
    }

    LLVM_DEBUG({ llvm::dbgs() << "Parsed constant pool with " << count << " slots\n"; });

    return result;
}

llvm::Expected<const ConstantPoolInfo&> jmf::ConstantPool::getEntry(std::uint16_t index) const
{
    if (index == 0)
    {
        return llvm::make_error<ResolutionError>(ResolutionError::IndexOutOfBounds, index, "index 0 is reserved");
    }
    if (index >= m_entries.size())
    {
        return llvm::make_error<ResolutionError>(
            ResolutionError::IndexOutOfBounds, index,
            llvm::formatv("constant pool has only {0} slots", m_entries.size()).str());
    }
    const ConstantPoolInfo& entry = m_entries[index];
    if (swl::holds_alternative<std::monostate>(entry))
    {
        return llvm::make_error<ResolutionError>(ResolutionError::IndexOutOfBounds, index,
                                                 "slot following a Long or Double entry is not addressable");
    }
    return entry;
}

llvm::Expected<llvm::StringRef> jmf::ConstantPool::getUtf8(PoolIndex<Utf8Info> index) const
{
    llvm::Expected<const Utf8Info*> info = index.resolve(*this);
    if (!info)
    {
        return info.takeError();
    }
    return (*info)->text;
}

llvm::Expected<llvm::StringRef> jmf::ConstantPool::getClassName(PoolIndex<ClassInfo> index) const
{
    llvm::Expected<const ClassInfo*> info = index.resolve(*this);
    if (!info)
    {
        return info.takeError();
    }
    return getUtf8((*info)->nameIndex);
}

void jmf::ConstantPool::push_back(ConstantPoolInfo info)
{
    if (m_entries.empty())
    {
        m_entries.emplace_back();
    }
    bool isWide = holdsAnyOf<LongInfo, DoubleInfo>(info);
    m_entries.push_back(std::move(info));
    if (isWide)
    {
        m_entries.emplace_back();
    }
}

llvm::StringRef jmf::getKindName(const ConstantPoolInfo& info)
{
    return match(
        info, [](std::monostate) { return "unusable"; }, [](const ClassInfo&) { return "Class"; },
        [](const FieldRefInfo&) { return "Fieldref"; }, [](const MethodRefInfo&) { return "Methodref"; },
        [](const InterfaceMethodRefInfo&) { return "InterfaceMethodref"; },
        [](const StringInfo&) { return "String"; }, [](const IntegerInfo&) { return "Integer"; },
        [](const FloatInfo&) { return "Float"; }, [](const LongInfo&) { return "Long"; },
        [](const DoubleInfo&) { return "Double"; }, [](const NameAndTypeInfo&) { return "NameAndType"; },
        [](const Utf8Info&) { return "Utf8"; }, [](const MethodHandleInfo&) { return "MethodHandle"; },
        [](const MethodTypeInfo&) { return "MethodType"; }, [](const DynamicInfo&) { return "Dynamic"; },
        [](const InvokeDynamicInfo&) { return "InvokeDynamic"; }, [](const ModuleInfo&) { return "Module"; },
        [](const PackageInfo&) { return "Package"; });
}
