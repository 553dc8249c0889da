#pragma once
#include "unitfleet/Process.hpp"

namespace unitfleet::process::detail {

// Платформенно-специфичная реализация запуска процесса
// Определяется в ProcessLinux.cpp
// Возвращает:
//   true - если процесс успешно запущен и завершился (независимо от exitCode)
//   false - если произошла ошибка при запуске процесса
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

} // namespace unitfleet::process::detail
