#include "TestSupport.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace unitfleet::test {

    TempDir::TempDir()
    {
        static std::atomic<int> counter{ 0 };
        path_ = fs::temp_directory_path() /
            ("unitfleet-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    TempDir::~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    void writeFile(const fs::path& file, const std::string& content)
    {
        fs::create_directories(file.parent_path());
        std::ofstream f(file, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot write " + file.string());
        f << content;
    }

    std::string readFile(const fs::path& file)
    {
        std::ifstream f(file, std::ios::binary);
        std::ostringstream os;
        os << f.rdbuf();
        return os.str();
    }

    void writeConfig(const fs::path& appDir, const fs::path& installLocation, bool useUser)
    {
        writeFile(appDir / "config.toml",
            "[systemd]\n"
            "install_location = \"" + installLocation.string() + "\"\n"
            "use_user = " + (useUser ? "true" : "false") + "\n");
    }

    void FakeController::record(bool userScope, const std::string& call)
    {
        calls.push_back((userScope ? "--user " : "") + call);
    }

    bool FakeController::isActive(const std::string& unit, bool userScope)
    {
        record(userScope, "is-active " + unit);
        return active;
    }

    bool FakeController::isEnabled(const std::string& unit, bool userScope)
    {
        record(userScope, "is-enabled " + unit);
        return enabled;
    }

    bool FakeController::start(const std::string& unit, bool userScope, Error* error)
    {
        record(userScope, "start " + unit);
        if (failStart) return fail(error, ErrorKind::ServiceCommand, "start failed");
        if (activateOnStart) active = true;
        return true;
    }

    bool FakeController::stop(const std::string& unit, bool userScope, Error* error)
    {
        record(userScope, "stop " + unit);
        if (failStop) return fail(error, ErrorKind::ServiceCommand, "stop failed");
        active = false;
        return true;
    }

    bool FakeController::reload(bool userScope, Error* error)
    {
        record(userScope, "daemon-reload");
        if (failReload) return fail(error, ErrorKind::ServiceCommand, "daemon-reload failed");
        return true;
    }

    bool FakeController::followLogs(const std::string& unit, bool userScope, Error* error)
    {
        record(userScope, "logs " + unit);
        if (failLogs) return fail(error, ErrorKind::ServiceCommand, "Failed to show logs for '" + unit + "'");
        return true;
    }

    bool FakeController::mutated() const
    {
        for (const auto& c : calls)
        {
            if (c.find("is-active") == std::string::npos && c.find("is-enabled") == std::string::npos)
                return true;
        }
        return false;
    }

    bool FakeConfirmer::confirm(const std::string& prompt)
    {
        ++asked;
        lastPrompt = prompt;
        return answer;
    }

} // namespace unitfleet::test
