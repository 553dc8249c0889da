#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "unitfleet/Confirm.hpp"
#include "unitfleet/Error.hpp"
#include "unitfleet/ServiceController.hpp"

namespace unitfleet::test {

    namespace fs = std::filesystem;

    //---Временная директория, удаляется в деструкторе
    class TempDir final {
    public:
        TempDir();
        ~TempDir();
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }

    private:
        fs::path path_;
    };

    void writeFile(const fs::path& file, const std::string& content);
    std::string readFile(const fs::path& file);

    //---Создаёт <appDir>/config.toml с секцией [systemd]
    void writeConfig(const fs::path& appDir, const fs::path& installLocation, bool useUser = false);

    //---Контроллер-заглушка: состояние в памяти, журнал вызовов
    //   Вызовы записываются как "[--user ]<verb> <unit>", например "start webapp.service"
    class FakeController final : public IServiceController {
    public:
        bool active = false;
        bool enabled = false;
        bool activateOnStart = true;

        bool failStart = false;
        bool failStop = false;
        bool failReload = false;
        bool failLogs = false;

        std::vector<std::string> calls;

        bool isActive(const std::string& unit, bool userScope) override;
        bool isEnabled(const std::string& unit, bool userScope) override;
        bool start(const std::string& unit, bool userScope, Error* error) override;
        bool stop(const std::string& unit, bool userScope, Error* error) override;
        bool reload(bool userScope, Error* error) override;
        bool followLogs(const std::string& unit, bool userScope, Error* error) override;

        //---Были ли изменяющие вызовы (всё, кроме is-active / is-enabled)
        bool mutated() const;

    private:
        void record(bool userScope, const std::string& call);
    };

    //---Подтверждение с заранее заданным ответом
    class FakeConfirmer final : public IConfirmer {
    public:
        bool answer = true;
        int asked = 0;
        std::string lastPrompt;

        bool confirm(const std::string& prompt) override;
    };

} // namespace unitfleet::test
