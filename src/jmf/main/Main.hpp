#pragma once

#include <llvm/ADT/ArrayRef.h>

namespace jmf
{
/// Main program of jmf. 'args' are the arguments INCLUDING the executable name/path.
/// Returns 0 if the scan completed, even if files were skipped, and 1 if the input was invalid.
int main(llvm::ArrayRef<char*> args);
} // namespace jmf
