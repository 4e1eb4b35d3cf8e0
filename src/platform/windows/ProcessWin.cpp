#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include <windows.h>
#include <vector>
#include <glog/logging.h>

namespace bklaunch::process::detail {

	//--- Преобразование строки UTF-8 в широкую строку (UTF-16) для Windows API
    static std::wstring utf8ToWide(const std::string& s)
    {
        //---Проверка на пустую строку
        if (s.empty()) return {};
        //---Выходной буфер пустой. получаем требуемое число wide-символов
        int n = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), nullptr, 0);
        if (n == 0)
        {
            LOG(ERROR) << "Failed to get required buffer size for UTF-8 to wide conversion";
            return {};
        }
        std::wstring w((size_t)n, L'\0');
        MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), w.data(), n);
        return w;
    }

    //---Корректное quoting аргументов под CreateProcess (правило backslashes+quotes)
    static std::wstring quoteWindowsArg(std::wstring_view arg)
    {
        //---Кавычки нужны если пустой аргумент, есть пробелы, табуляции, переводы строк или кавычки
        const bool needQuotes =
            arg.empty() || (arg.find_first_of(L" \t\n\v\"") != std::wstring_view::npos);

        if (!needQuotes) return std::wstring(arg);

        std::wstring out;
        out.reserve(arg.size() + 2);
        out.push_back(L'"');

        //---Счетчик последовательных обратных слешей
        std::size_t bsCount = 0;
        for (wchar_t ch : arg)
        {
            if (ch == L'\\')
            {
                ++bsCount;
                out.push_back(L'\\');
                continue;
            }
            if (ch == L'"')
            {
                //--удвоить backslash'и перед кавычкой и экранировать кавычку
                out.append(bsCount, L'\\');
                bsCount = 0;
                out.push_back(L'\\');
                out.push_back(L'"');
                continue;
            }
            bsCount = 0;
            out.push_back(ch);
        }

        //---Удваиваем слеши перед закрывающей кавычкой
        out.append(bsCount, L'\\');
        out.push_back(L'"');
        return out;
    }
	//---Построение командной строки для CreateProcess
    static std::wstring buildCommandLine(const fs::path& exe, const std::vector<std::string>& args)
    {
        std::wstring cmd = quoteWindowsArg(exe.wstring());
        for (const auto& a : args)
        {
            cmd.push_back(L' ');
            cmd += quoteWindowsArg(utf8ToWide(a));
        }
        return cmd;
    }

    static void closeIf(HANDLE& h)
    {
        if (h != nullptr && h != INVALID_HANDLE_VALUE)
        {
            CloseHandle(h);
            h = nullptr;
        }
    }

    //---Дескриптор для стандартного потока дочернего процесса.
    //   ownRead/ownWrite - созданные здесь дескрипторы (закрываются вызывающим)
    static bool prepareStream(Stdio mode, DWORD stdId, HANDLE& childEnd, HANDLE& parentRead, HANDLE& ownWrite)
    {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        if (mode == Stdio::Capture)
        {
            if (!CreatePipe(&parentRead, &ownWrite, &sa, 0)) return false;
            //---Читающий конец не наследуется дочерним процессом
            SetHandleInformation(parentRead, HANDLE_FLAG_INHERIT, 0);
            childEnd = ownWrite;
            return true;
        }
        if (mode == Stdio::Null)
        {
            ownWrite = CreateFileW(L"NUL", GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
            if (ownWrite == INVALID_HANDLE_VALUE) { ownWrite = nullptr; return false; }
            childEnd = ownWrite;
            return true;
        }
        childEnd = GetStdHandle(stdId);
        return true;
    }

	//---Платформенно-специфичная реализация запуска процесса для Windows
    bool spawnPlatform(const fs::path& exe, const std::vector<std::string>& args,
        const RunOptions& opt, SpawnedHandles& h, std::uint32_t& sysError)
    {
        h = {};
        sysError = 0;

        HANDLE outRead = nullptr, outWrite = nullptr;
        HANDLE errRead = nullptr, errWrite = nullptr;
        HANDLE childOut = nullptr, childErr = nullptr;

        if (!prepareStream(opt.stdoutMode, STD_OUTPUT_HANDLE, childOut, outRead, outWrite) ||
            !prepareStream(opt.stderrMode, STD_ERROR_HANDLE, childErr, errRead, errWrite))
        {
            sysError = GetLastError();
            closeIf(outRead); closeIf(outWrite);
            closeIf(errRead); closeIf(errWrite);
            LOG(ERROR) << "Failed to create pipes for " << exe << " with error: " << sysError;
            return false;
        }

        //---Собираем командную строку из пути к исполняемому файлу и аргументов
        const std::wstring cmdLine = buildCommandLine(exe, args);
        std::vector<wchar_t> buf(cmdLine.begin(), cmdLine.end());
        buf.push_back(L'\0');

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        si.hStdOutput = childOut;
        si.hStdError = childErr;

        PROCESS_INFORMATION pi{};

        const DWORD flags = opt.hideWindow ? CREATE_NO_WINDOW : 0;
        const std::wstring cwdW = opt.workingDir.empty() ? L"" : opt.workingDir.wstring();
        const wchar_t* cwdPtr = opt.workingDir.empty() ? nullptr : cwdW.c_str();

        //---Имя приложения не задаётся: CreateProcess ищет exe из командной строки в PATH
        BOOL ok = CreateProcessW(
            nullptr,               // Имя исполняемого файла берётся из командной строки
            buf.data(),            // Командная строка (mutable)
            nullptr, nullptr,      // Атрибуты безопасности
            TRUE,                  // Наследование дескрипторов stdout/stderr
            flags,
            nullptr,               // Переменные окружения(наследовать от родителя)
            cwdPtr,                // Рабочая директория(nullptr = текущая директория)
            &si,
            &pi
        );

        //---Пишущие концы нужны только дочернему процессу
        closeIf(outWrite);
        closeIf(errWrite);

        if (!ok)
        {
            sysError = GetLastError();
            closeIf(outRead);
            closeIf(errRead);
            LOG(ERROR) << "Failed to create process " << exe << " with error: " << sysError;
            return false;
        }

        CloseHandle(pi.hThread);

        h.pid = (std::int64_t)pi.dwProcessId;
        h.process = (NativeHandle)pi.hProcess;
        h.out = outRead ? (NativeHandle)outRead : kInvalidHandle;
        h.err = errRead ? (NativeHandle)errRead : kInvalidHandle;
        return true;
    }

    bool waitPlatform(NativeHandle process, RunResult& out)
    {
        HANDLE hp = (HANDLE)process;

        //---Ожидаем завершения процесса без таймаута
        if (WaitForSingleObject(hp, INFINITE) == WAIT_FAILED)
        {
            out.sysError = GetLastError();
            LOG(ERROR) << "WaitForSingleObject failed with error " << out.sysError << " (process handle: " << hp << ")";
            return false;
        }

        DWORD code = 0;
        if (!GetExitCodeProcess(hp, &code))
        {
            out.sysError = GetLastError();
            LOG(ERROR) << "Failed to get exit code for process with error " << out.sysError << ". Process may have terminated abnormally.";
            return false;
        }

        out.exited = true;
        out.exitCode = (int)code;
        return true;
    }

    long long readPipePlatform(NativeHandle h, char* buf, std::size_t size, std::uint32_t& sysError)
    {
        DWORD n = 0;
        if (!ReadFile((HANDLE)h, buf, (DWORD)size, &n, nullptr))
        {
            const DWORD e = GetLastError();
            //---Писатель закрыл канал - это конец ввода
            if (e == ERROR_BROKEN_PIPE) return 0;
            sysError = e;
            return -1;
        }
        return (long long)n;
    }

    int waitReadablePlatform(NativeHandle h, int timeoutMs, std::uint32_t& sysError)
    {
        //---Анонимные каналы не поддерживают ожидание: опрос PeekNamedPipe
        const ULONGLONG start = GetTickCount64();
        for (;;)
        {
            DWORD avail = 0;
            if (!PeekNamedPipe((HANDLE)h, nullptr, 0, nullptr, &avail, nullptr))
            {
                const DWORD e = GetLastError();
                //---Писатель закрыл канал: ReadFile сообщит конец ввода
                if (e == ERROR_BROKEN_PIPE) return 1;
                sysError = e;
                return -1;
            }
            if (avail > 0) return 1;
            if (GetTickCount64() - start >= (ULONGLONG)timeoutMs) return 0;
            Sleep(10);
        }
    }

    void closePipePlatform(NativeHandle h)
    {
        CloseHandle((HANDLE)h);
    }

    void releaseProcessPlatform(NativeHandle process)
    {
        CloseHandle((HANDLE)process);
    }

} // namespace bklaunch::process::detail
#endif
