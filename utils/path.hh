// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef TEXTFLOW_UTILS_PATH_HH
#define TEXTFLOW_UTILS_PATH_HH

#include <filesystem>
namespace fs = std::filesystem;

namespace textflow {

// Get home directory path.
fs::path home_path();

// Expand `~' and environment variables, without running commands.
fs::path expand_path(const fs::path &);

// A fresh, unique path in the temporary directory.
fs::path make_temp_path();

} // namespace textflow

#endif // TEXTFLOW_UTILS_PATH_HH
