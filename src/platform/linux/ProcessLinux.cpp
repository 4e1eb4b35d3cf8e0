#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glog/logging.h>

namespace bklaunch::process::detail {

    namespace {

        //---Закрытие fd, если он открыт
        void closeFd(int& fd)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        //---Канал с O_CLOEXEC на обоих концах
        bool makePipe(int fds[2])
        {
            return ::pipe2(fds, O_CLOEXEC) == 0;
        }

        //---Настройка одного стандартного потока в дочернем процессе (после fork).
        //   Только async-signal-safe вызовы.
        bool setupChildStream(Stdio mode, int pipeWrite, int target)
        {
            if (mode == Stdio::Capture)
                return ::dup2(pipeWrite, target) >= 0;

            if (mode == Stdio::Null)
            {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull < 0) return false;
                const bool ok = ::dup2(devnull, target) >= 0;
                ::close(devnull);
                return ok;
            }
            return true; // Inherit
        }

        //---Сообщить родителю errno и завершиться (exec не удался)
        [[noreturn]] void failChild(int errWrite)
        {
            const int e = errno;
            ssize_t n;
            do {
                n = ::write(errWrite, &e, sizeof(e));
            } while (n < 0 && errno == EINTR);
            _exit(127);
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool spawnPlatform(const fs::path& exe, const std::vector<std::string>& args,
        const RunOptions& opt, SpawnedHandles& h, std::uint32_t& sysError)
    {
        h = {};
        sysError = 0;

        //---argv собирается до fork: в дочернем процессе только exec
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        const std::string cwd = opt.workingDir.string();

        int outPipe[2] = { -1, -1 };
        int errPipe[2] = { -1, -1 };
        int execPipe[2] = { -1, -1 };   // Канал ошибки exec (закрывается сам при успешном exec)

        auto closeAll = [&]() {
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(errPipe[0]); closeFd(errPipe[1]);
            closeFd(execPipe[0]); closeFd(execPipe[1]);
        };

        if ((opt.stdoutMode == Stdio::Capture && !makePipe(outPipe)) ||
            (opt.stderrMode == Stdio::Capture && !makePipe(errPipe)) ||
            !makePipe(execPipe))
        {
            sysError = (std::uint32_t)errno;
            closeAll();
            LOG(ERROR) << "Failed to create pipes for " << exe << ": errno " << sysError;
            return false;
        }

        pid_t pid = fork();
        if (pid < 0)
        {
            sysError = (std::uint32_t)errno;
            closeAll();
            LOG(ERROR) << "fork() failed for " << exe << ": errno " << sysError;
            return false;
        }

        if (pid == 0)
        {
            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
                failChild(execPipe[1]);

            if (!setupChildStream(opt.stdoutMode, outPipe[1], STDOUT_FILENO) ||
                !setupChildStream(opt.stderrMode, errPipe[1], STDERR_FILENO))
                failChild(execPipe[1]);

            //---Без '/' в имени execvp ищет исполняемый файл в PATH
            execvp(argv[0], argv.data());
            failChild(execPipe[1]);
        }

        //---Родитель: пишущие концы принадлежат только дочернему процессу
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(execPipe[1]);

        //---Если exec прошёл, канал закрылся (O_CLOEXEC) и read вернёт 0
        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        closeFd(execPipe[0]);

        if (n == (ssize_t)sizeof(childErrno))
        {
            //---exec не удался: забираем дочерний процесс, чтобы не оставить зомби
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

            closeFd(outPipe[0]);
            closeFd(errPipe[0]);
            sysError = (std::uint32_t)childErrno;
            return false;
        }

        h.pid = pid;
        h.process = (NativeHandle)pid;
        h.out = outPipe[0] >= 0 ? (NativeHandle)outPipe[0] : kInvalidHandle;
        h.err = errPipe[0] >= 0 ? (NativeHandle)errPipe[0] : kInvalidHandle;
        return true;
    }

    bool waitPlatform(NativeHandle process, RunResult& out)
    {
        const pid_t pid = (pid_t)process;

        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);

        if (r < 0)
        {
            out.sysError = (std::uint32_t)errno;
            LOG(ERROR) << "waitpid failed for pid " << pid << ": errno " << out.sysError;
            return false;
        }

        if (WIFEXITED(status))
        {
            out.exited = true;
            out.exitCode = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            out.exited = false;
            out.termSignal = WTERMSIG(status);
        }
        return true;
    }

    long long readPipePlatform(NativeHandle h, char* buf, std::size_t size, std::uint32_t& sysError)
    {
        ssize_t n;
        do {
            n = ::read((int)h, buf, size);
        } while (n < 0 && errno == EINTR);

        if (n < 0) sysError = (std::uint32_t)errno;
        return (long long)n;
    }

    int waitReadablePlatform(NativeHandle h, int timeoutMs, std::uint32_t& sysError)
    {
        pollfd pfd{};
        pfd.fd = (int)h;
        pfd.events = POLLIN;

        //---POLLHUP / POLLERR тоже считаются готовностью: read вернёт 0 или ошибку
        int r;
        do {
            r = ::poll(&pfd, 1, timeoutMs);
        } while (r < 0 && errno == EINTR);

        if (r < 0)
        {
            sysError = (std::uint32_t)errno;
            return -1;
        }
        return r;
    }

    void closePipePlatform(NativeHandle h)
    {
        ::close((int)h);
    }

    void releaseProcessPlatform(NativeHandle /*process*/)
    {
    }

} // namespace bklaunch::process::detail
#endif
