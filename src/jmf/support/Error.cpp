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

#include "Error.hpp"

#include <llvm/Support/raw_ostream.h>

char jmf::ClassFileError::ID = 0;
char jmf::ResolutionError::ID = 0;
char jmf::ByteCodeError::ID = 0;
char jmf::InputError::ID = 0;

void jmf::ClassFileError::log(llvm::raw_ostream& os) const
{
    switch (m_kind)
    {
        case UnexpectedEof: os << "unexpected end of file"; break;
        case InvalidMagic: os << "invalid class file magic"; break;
        case InvalidConstantTag: os << "invalid constant pool tag"; break;
    }
    if (!m_message.empty())
    {
        os << ": " << m_message;
    }
}

void jmf::ResolutionError::log(llvm::raw_ostream& os) const
{
    os << "cannot resolve constant pool index " << m_index << ": " << m_message;
}

void jmf::ByteCodeError::log(llvm::raw_ostream& os) const
{
    os << "malformed bytecode at offset " << m_offset << ": " << m_message;
}

void jmf::InputError::log(llvm::raw_ostream& os) const
{
    os << m_message;
}
