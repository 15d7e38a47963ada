#pragma once
/*
================================================================================
Log: File Sink
FILE: cpp/glint/log/file_sink.hpp

Contract:
  - Opens path in append mode for every call; creates the file if absent,
    never truncates.
  - Writes line + '\n' and closes (no buffering across calls).
  - Any failure (missing directory, permissions, disk full) throws IOError
    carrying the path and errno. Nothing is retried.
================================================================================
*/

#include <string>
#include <string_view>

namespace glint {

void append_line(const std::string& path, std::string_view line);

} // namespace glint
