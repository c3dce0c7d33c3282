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

#include <jmf/scanner/TreeScanner.hpp>

#include <string>

namespace jmf
{

/// Format in which the calls of a scan are printed.
enum class OutputFormat
{
    Text,
    Json,
};

/// Returns the '<class>#<method>' form of 'target'.
std::string formatTarget(const TargetMethod& target);

/// Returns the '<class>#<method> (L<line>)' form of 'call'. The line suffix is omitted for calls without line number.
std::string formatCall(const MethodCall& call);

/// Writes the target on the first line followed by one ' - <call>' line per call, or 'No results' if there are no
/// calls.
void writeTextReport(llvm::raw_ostream& os, const TargetMethod& target, llvm::ArrayRef<MethodCall> calls);

/// Writes a pretty printed JSON object with the fields 'target' and 'calls'.
void writeJsonReport(llvm::raw_ostream& os, const TargetMethod& target, llvm::ArrayRef<MethodCall> calls);

/// Dispatches to 'writeTextReport' or 'writeJsonReport'.
void writeReport(llvm::raw_ostream& os, OutputFormat format, const TargetMethod& target,
                 llvm::ArrayRef<MethodCall> calls);

/// Writes one 'warning: <path>: <message>' line per warning.
void writeWarnings(llvm::raw_ostream& os, llvm::ArrayRef<ScanWarning> warnings);

} // namespace jmf
