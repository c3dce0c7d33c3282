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

#include <llvm/ADT/Twine.h>
#include <llvm/Support/raw_ostream.h>

#include <mutex>

namespace jmf
{

/// Stream of 'debug: <message>' progress lines shared by the worker threads of a scan.
/// Lines are written whole even if several threads report at once. A log without stream discards everything.
class ProgressLog
{
    llvm::raw_ostream* m_os;
    std::mutex m_mutex;

public:
    explicit ProgressLog(llvm::raw_ostream* os = nullptr) : m_os(os) {}

    /// Returns true if messages are written anywhere.
    bool isEnabled() const
    {
        return m_os != nullptr;
    }

    void note(const llvm::Twine& message);
};

} // namespace jmf
