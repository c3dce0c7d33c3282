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
#include <llvm/Support/Endian.h>
#include <llvm/Support/Error.h>

#include <jmf/support/Error.hpp>

#include <cstdint>
#include <cstring>
#include <type_traits>

namespace jmf
{

/// Smallest unsigned integer type that is at least as large as 'T'.
template <class T>
requires(sizeof(T) <= sizeof(std::uint64_t)) using NextSizedUInt =
    std::conditional_t<sizeof(T) <= 2, std::conditional_t<sizeof(T) <= 1, std::uint8_t, std::uint16_t>,
                       std::conditional_t<(sizeof(T) > 4), std::uint64_t, std::uint32_t>>;

/// Sequential big-endian cursor over a byte buffer, as used by all JVM binary formats.
///
/// Reads never go out of bounds. If a read requests more bytes than remain, the reader records an 'UnexpectedEof'
/// 'ClassFileError', returns a zero value and stays in the failed state: every following read fails as well without
/// advancing. This allows parsers to read a whole structure and check for errors once at the end, similar to
/// 'llvm::DataExtractor::Cursor'. The recorded error is retrieved with 'takeError'.
class ByteReader
{
    llvm::ArrayRef<char> m_bytes;
    std::size_t m_offset = 0;
    bool m_failed = false;
    // Offset and size of the first read that failed.
    std::size_t m_failedOffset = 0;
    std::size_t m_failedLength = 0;

    bool reserve(std::size_t length);

public:
    explicit ByteReader(llvm::ArrayRef<char> bytes) : m_bytes(bytes) {}

    /// Reads an instance of 'T' and advances the cursor by 'sizeof(T)'. The value is converted from big endian to
    /// the host format. 'T' must be trivially copyable.
    template <class T>
    T consume()
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        if (!reserve(sizeof(T)))
        {
            return T{};
        }
        NextSizedUInt<T> asBytes;
        std::memcpy(&asBytes, m_bytes.data() + m_offset, sizeof(T));
        m_offset += sizeof(T);
        asBytes = llvm::support::endian::byte_swap(asBytes, llvm::support::big);

        T result;
        std::memcpy(&result, &asBytes, sizeof(T));
        return result;
    }

    /// Reads 'length' raw bytes. Returns an empty array if not enough bytes are left.
    llvm::ArrayRef<char> consumeBytes(std::size_t length);

    /// Reads 'length' raw bytes as a string. Returns an empty string if not enough bytes are left.
    llvm::StringRef consumeString(std::size_t length)
    {
        llvm::ArrayRef<char> bytes = consumeBytes(length);
        return {bytes.data(), bytes.size()};
    }

    /// Advances the cursor by 'length' bytes without looking at them.
    void skip(std::size_t length)
    {
        if (reserve(length))
        {
            m_offset += length;
        }
    }

    /// Returns the amount of bytes read so far.
    std::size_t getOffset() const
    {
        return m_offset;
    }

    /// Returns the amount of bytes that have not yet been read.
    std::size_t remaining() const
    {
        return m_bytes.size() - m_offset;
    }

    /// Returns true if any read failed so far.
    bool hasError() const
    {
        return m_failed;
    }

    /// Returns an 'UnexpectedEof' error describing the first failed read or success if no read failed.
    /// The reader stays in the failed state.
    llvm::Error takeError() const;
};

} // namespace jmf
