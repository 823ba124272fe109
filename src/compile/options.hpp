// Numify Expression Compiler - Compile Options
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

namespace numify {

struct CompileOptions {
  bool vectorize = true;         // accept arrays and broadcast them
  bool expandDefinition = true;  // expand custom-function definitions before codegen
  bool cache = true;             // consult the compiler's cache, if it has one
  int optLevel = 2;              // 0-3
  int maxRewritePasses = 10;
};

}  // namespace numify
