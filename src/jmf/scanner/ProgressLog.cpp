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

#include "ProgressLog.hpp"

#include <llvm/Support/WithColor.h>

void jmf::ProgressLog::note(const llvm::Twine& message)
{
    if (!m_os)
    {
        return;
    }
    std::lock_guard lock{m_mutex};
    llvm::WithColor(*m_os, llvm::HighlightColor::Remark) << "debug: ";
    *m_os << message << '\n';
}
