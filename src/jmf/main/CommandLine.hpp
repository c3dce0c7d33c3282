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
#include <llvm/Support/raw_ostream.h>

#include <jmf/output/Report.hpp>
#include <jmf/scanner/InvocationScanner.hpp>

#include <optional>
#include <string>

namespace jmf
{
/// Settings of a 'jmf' invocation as given on the command line.
struct CommandLineOptions
{
    TargetMethod target;
    std::string scanFolder;
    OutputFormat format = OutputFormat::Text;
    bool verbose = false;
    unsigned threads = 0;
    bool includeSelfCalls = false;
};

/// Parses 'args', INCLUDING the executable name. Errors are printed to 'errs' in which case an empty optional is
/// returned. Exits the process after printing the help text if requested.
std::optional<CommandLineOptions> parseCommandLine(llvm::ArrayRef<char*> args, llvm::raw_ostream& errs);

} // namespace jmf
