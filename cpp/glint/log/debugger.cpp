#include "glint/log/debugger.hpp"

#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/types.h>
#include <unistd.h>
#else
#include <exception>
#include <fstream>
#include <string>
#endif

namespace glint {

bool debugger_attached() noexcept {
#if defined(_WIN32)
  return ::IsDebuggerPresent() != 0;
#elif defined(__APPLE__)
  int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, static_cast<int>(::getpid())};
  kinfo_proc info{};
  size_t size = sizeof(info);
  if (::sysctl(mib, 4, &info, &size, nullptr, 0) != 0) return false;
  return (info.kp_proc.p_flag & P_TRACED) != 0;
#else
  try {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
      static constexpr char kKey[] = "TracerPid:";
      if (line.compare(0, sizeof(kKey) - 1, kKey) != 0) continue;
      for (size_t i = sizeof(kKey) - 1; i < line.size(); ++i) {
        const char c = line[i];
        if (c == ' ' || c == '\t') continue;
        return c != '0';
      }
      return false;
    }
  } catch (const std::exception&) {
    // No procfs view: treat as "not being debugged".
  }
  return false;
#endif
}

} // namespace glint
