#include "unitfleet/Process.hpp"
#include "platform/ProcessImpl.hpp"

namespace unitfleet::process {

// Реализация публичной функции запуска процесса
// Выступает в качестве оболочки для платформенно-специфичной реализации
// (detail::runPlatform, см. platform/linux/ProcessLinux.cpp)
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        return detail::runPlatform(exe, args, out, opt);
    }

} // namespace unitfleet::process
