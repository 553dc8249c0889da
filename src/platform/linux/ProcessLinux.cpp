#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace unitfleet::process::detail {

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---argv готовим до fork: после fork в дочернем процессе только exec
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            out.started = false;
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (pid == 0)
        {
            if (opt.silenceOutput)
            {
                int devNull = ::open("/dev/null", O_WRONLY);
                if (devNull >= 0)
                {
                    (void)dup2(devNull, STDOUT_FILENO);
                    (void)dup2(devNull, STDERR_FILENO);
                    if (devNull > STDERR_FILENO) close(devNull);
                }
            }

            execv(argvStorage[0].c_str(), argv.data());
            _exit(127); // exec failed
        }

        out.started = true;

        int status = 0;
        pid_t waited = 0;
        do
        {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

} // namespace unitfleet::process::detail
#endif
