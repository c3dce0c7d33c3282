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

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>

namespace jmf
{

/// Error produced while decoding the binary structure of a class file.
/// Any of these make the whole class file unusable.
class ClassFileError : public llvm::ErrorInfo<ClassFileError>
{
public:
    enum Kind : std::uint8_t
    {
        /// A read went past the end of the available bytes.
        UnexpectedEof,
        /// The file does not start with 0xCAFEBABE.
        InvalidMagic,
        /// A constant pool entry has a tag not defined by the JVM specification.
        InvalidConstantTag,
    };

    static char ID;

    ClassFileError(Kind kind, std::string message) : m_kind(kind), m_message(std::move(message)) {}

    Kind getKind() const
    {
        return m_kind;
    }

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }

private:
    Kind m_kind;
    std::string m_message;
};

/// Error produced when following a chain of constant pool indices fails.
/// These are recoverable: callers skip the entity whose reference could not be resolved.
class ResolutionError : public llvm::ErrorInfo<ResolutionError>
{
public:
    enum Kind : std::uint8_t
    {
        /// The index is 0, past the end of the pool or otherwise not addressable.
        IndexOutOfBounds,
        /// The index refers to an entry of an unexpected kind.
        WrongEntryKind,
        /// The index was expected to refer to a 'Utf8' entry but does not.
        Utf8Expected,
    };

    static char ID;

    ResolutionError(Kind kind, std::uint16_t index, std::string message)
        : m_kind(kind), m_index(index), m_message(std::move(message))
    {
    }

    Kind getKind() const
    {
        return m_kind;
    }

    std::uint16_t getIndex() const
    {
        return m_index;
    }

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return std::make_error_code(std::errc::invalid_argument);
    }

private:
    Kind m_kind;
    std::uint16_t m_index;
    std::string m_message;
};

/// Error produced when a bytecode stream cannot be safely advanced. Fatal only to the method containing it.
class ByteCodeError : public llvm::ErrorInfo<ByteCodeError>
{
public:
    static char ID;

    ByteCodeError(std::size_t offset, std::string message) : m_offset(offset), m_message(std::move(message)) {}

    /// Returns the offset of the instruction that could not be decoded.
    std::size_t getOffset() const
    {
        return m_offset;
    }

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }

private:
    std::size_t m_offset;
    std::string m_message;
};

/// Error in the arguments given to a scan. Reported before any file is looked at.
class InputError : public llvm::ErrorInfo<InputError>
{
public:
    static char ID;

    explicit InputError(std::string message) : m_message(std::move(message)) {}

    void log(llvm::raw_ostream& os) const override;

    std::error_code convertToErrorCode() const override
    {
        return std::make_error_code(std::errc::invalid_argument);
    }

private:
    std::string m_message;
};

} // namespace jmf
