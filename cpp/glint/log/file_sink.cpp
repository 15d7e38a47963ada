#include "glint/log/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

#include "glint/core/errors.hpp"

namespace glint {

namespace {

[[noreturn]] void throw_io(const char* what, const std::string& path, int err) {
  std::string msg = std::string(what) + " '" + path + "'";
  if (err != 0) msg += std::string(": ") + std::strerror(err);
  throw IOError(std::move(msg), path, err);
}

} // namespace

void append_line(const std::string& path, std::string_view line) {
  errno = 0;
  std::ofstream out(path, std::ios::out | std::ios::app);
  if (!out.is_open()) throw_io("cannot open log file", path, errno);

  out.write(line.data(), static_cast<std::streamsize>(line.size()));
  out.put('\n');  // text mode: platform line ending
  out.flush();
  if (!out) throw_io("cannot write log file", path, errno);

  out.close();
  if (out.fail()) throw_io("cannot close log file", path, errno);
}

} // namespace glint
