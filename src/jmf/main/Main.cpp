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

#include "Main.hpp"

#include <llvm/Support/WithColor.h>

#include <jmf/output/Report.hpp>
#include <jmf/scanner/TreeScanner.hpp>

#include "CommandLine.hpp"

int jmf::main(llvm::ArrayRef<char*> args)
{
    std::optional<CommandLineOptions> commandLine = parseCommandLine(args, llvm::errs());
    if (!commandLine)
    {
        return 1;
    }

    ScanOptions options{
        .threads = commandLine->threads,
        .includeSelfCalls = commandLine->includeSelfCalls,
        .log = commandLine->verbose ? &llvm::errs() : nullptr,
    };

    llvm::Expected<ScanResult> result = scan(commandLine->scanFolder, commandLine->target, options);
    if (!result)
    {
        llvm::WithColor::error() << llvm::toString(result.takeError()) << '\n';
        return 1;
    }

    writeWarnings(llvm::errs(), result->warnings);
    writeReport(llvm::outs(), commandLine->format, commandLine->target, result->calls);
    llvm::outs().flush();
    return 0;
}
