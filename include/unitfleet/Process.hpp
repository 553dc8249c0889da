#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace unitfleet::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        bool silenceOutput = false;   // Перенаправить stdout/stderr процесса в /dev/null
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс (true - да, false - ошибка запуска)
        int exitCode = 0;             // Код завершения процесса (или синтетический код при ошибках)
        std::uint32_t sysError = 0;   // Код системной ошибки (errno)
    };
    //---Запускает внешний процесс с заданными параметрами
    // 
    // Параметры:
    //   exe - абсолютный путь к исполняемому файлу
    //   args - аргументы командной строки для передачи процессу
    //   out - структура для записи результатов выполнения (передается по ссылке)
    //   opt - опции запуска процесса (по умолчанию пустые)
    // Возвращает:
    //   true - если процесс успешно запущен и завершился (независимо от exitCode)
    //   false - если произошла ошибка при запуске процесса
    // Примечание:
    //   Функция блокирующая - ожидает завершения процесса.
    //   Если exec не удался, дочерний процесс завершается с кодом 127
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

} // namespace unitfleet::process
