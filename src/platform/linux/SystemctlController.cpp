#if defined(__linux__)

#include "unitfleet/ServiceController.hpp"
#include "unitfleet/Process.hpp"
#include "platform/PlatformImpl.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace unitfleet {

    namespace {

        //---Проверка корректности имени systemd unit
        //   разрешенные символы: A-Z, a-z, 0-9, '_', '.', '-', '@', ':'
        static bool isValidUnitName(const std::string& name)
        {
            if (name.empty()) return false;

            for (char c : name)
            {
                const bool ok =
                    (c >= 'a' && c <= 'z') ||
                    (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') ||
                    c == '_' || c == '.' || c == '-' || c == '@' || c == ':';
                if (!ok) return false;
            }
            return true;
        }

        //---Добавляет --user первым аргументом для пользовательского экземпляра
        static std::vector<std::string> scoped(std::vector<std::string> args, bool userScope)
        {
            if (userScope) args.insert(args.begin(), "--user");
            return args;
        }

        //---Запускает утилиту и проверяет код возврата (0 — успех)
        // Параметры:
        //   exe - путь к systemctl / journalctl
        //   args - аргументы (например {"start", "myservice.service"})
        //   error - приёмник ошибки (если указан)
        //   what - описание операции для сообщений об ошибках
        static bool runTool(const fs::path& exe,
            const std::vector<std::string>& args,
            Error* error,
            const std::string& what)
        {
            process::RunResult rr;
            const bool ok = process::run(exe, args, rr, process::RunOptions{});
            if (!ok || !rr.started)
            {
                std::ostringstream os;
                os << what << ": failed to start " << exe.string() << ". sysError=" << rr.sysError;
                return fail(error, ErrorKind::ServiceCommand, os.str());
            }

            if (rr.exitCode == 0) return true;

            std::ostringstream os;
            os << what << ": " << exe.filename().string() << " exitCode=" << rr.exitCode;
            return fail(error, ErrorKind::ServiceCommand, os.str());
        }

    } // namespace

    //---SystemctlController - управление unit'ами через systemctl / journalctl
    class SystemctlController final : public IServiceController {
    public:
        explicit SystemctlController(ToolPaths paths) : paths_(std::move(paths)) {}

        bool isActive(const std::string& unit, bool userScope) override
        {
            return query("is-active", unit, userScope);
        }

        bool isEnabled(const std::string& unit, bool userScope) override
        {
            return query("is-enabled", unit, userScope);
        }

        //---Запуск unit'а
        bool start(const std::string& unit, bool userScope, Error* error) override
        {
            if (!isValidUnitName(unit))
                return fail(error, ErrorKind::ServiceCommand, "start: invalid unit name '" + unit + "'");
            return runTool(paths_.systemctl, scoped({ "start", unit }, userScope), error, "systemctl start " + unit);
        }

        //---Остановка unit'а
        bool stop(const std::string& unit, bool userScope, Error* error) override
        {
            if (!isValidUnitName(unit))
                return fail(error, ErrorKind::ServiceCommand, "stop: invalid unit name '" + unit + "'");
            return runTool(paths_.systemctl, scoped({ "stop", unit }, userScope), error, "systemctl stop " + unit);
        }

        //---Перезагрузка конфигурации systemd
        bool reload(bool userScope, Error* error) override
        {
            return runTool(paths_.systemctl, scoped({ "daemon-reload" }, userScope), error, "systemctl daemon-reload");
        }

        //---journalctl -u <unit> -f на переднем плане
        bool followLogs(const std::string& unit, bool userScope, Error* error) override
        {
            if (!isValidUnitName(unit))
                return fail(error, ErrorKind::ServiceCommand, "logs: invalid unit name '" + unit + "'");
            if (!runTool(paths_.journalctl, scoped({ "-u", unit, "-f" }, userScope), nullptr, "journalctl"))
                return fail(error, ErrorKind::ServiceCommand, "Failed to show logs for '" + unit + "'");
            return true;
        }

    private:
        //---is-active / is-enabled --quiet: только код возврата, ошибки → false
        bool query(const char* verb, const std::string& unit, bool userScope) const
        {
            if (!isValidUnitName(unit)) return false;

            process::RunResult rr;
            process::RunOptions opt;
            opt.silenceOutput = true;
            if (!process::run(paths_.systemctl, scoped({ verb, "--quiet", unit }, userScope), rr, opt))
                return false;
            return rr.started && rr.exitCode == 0;
        }

        ToolPaths paths_;
    };

} // namespace unitfleet

namespace unitfleet::platform {

    //---Фабричная функция для создания контроллера Linux/systemd
    std::unique_ptr<IServiceController> makeController(const ToolPaths& paths)
    {
        return std::make_unique<unitfleet::SystemctlController>(paths);
    }

} // namespace unitfleet::platform

#endif // __linux__
