#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bklaunch::process {

    namespace fs = std::filesystem;

    //---Платформенный дескриптор (fd на Linux, HANDLE на Windows)
    using NativeHandle = std::intptr_t;
    inline constexpr NativeHandle kInvalidHandle = -1;

    //---Режим стандартного потока дочернего процесса
    enum class Stdio {
        Inherit,    // Наследуется от лаунчера
        Capture,    // Перенаправляется в канал (pipe), читается лаунчером
        Null        // /dev/null (NUL на Windows)
    };

    struct RunOptions final {
        fs::path workingDir;                // Рабочий каталог для запускаемого процесса (опционально)
        Stdio stdoutMode = Stdio::Inherit;  // stdout дочернего процесса
        Stdio stderrMode = Stdio::Inherit;  // stderr дочернего процесса
        bool hideWindow = true;             // Скрыть окно консоли (Windows: CREATE_NO_WINDOW, Linux: игнорируется)
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс
        bool exited = false;          // Процесс завершился сам (exitCode достоверен)
        int exitCode = 0;             // Код завершения процесса (если exited)
        int termSignal = 0;           // Номер сигнала, если процесс убит сигналом (Linux)
        std::uint32_t sysError = 0;   // Код системной ошибки (GetLastError() на Windows или errno на Linux)
        std::string output;           // Захваченный stdout (Stdio::Capture)
        std::string errorOutput;      // Захваченный stderr (Stdio::Capture)
    };

    //---Чтение канала дочернего процесса построчно до конца ввода.
    //   Владеет дескриптором, закрывает его в деструкторе.
    class PipeReader final {
    public:
        PipeReader() = default;
        explicit PipeReader(NativeHandle h) : handle_(h) {}
        ~PipeReader();

        PipeReader(PipeReader&& other) noexcept;
        PipeReader& operator=(PipeReader&& other) noexcept;
        PipeReader(const PipeReader&) = delete;
        PipeReader& operator=(const PipeReader&) = delete;

        bool valid() const { return handle_ != kInvalidHandle; }

        //---Следующая строка без '\n' и завершающего '\r'.
        //   false - конец ввода (или ошибка чтения); последняя строка без '\n' тоже возвращается.
        bool readLine(std::string& line);

        //---Весь оставшийся вывод до конца ввода
        std::string readAll();

        //---Флаг отмены: пока он не выставлен, чтение ждёт данных как обычно;
        //   после выставления дочитывается только уже доступный вывод.
        //   Флаг должен жить дольше чтения.
        void setCancelFlag(const std::atomic<bool>* flag) { cancel_ = flag; }

        //---Чтение остановлено флагом отмены (канал ещё открыт на другой стороне)
        bool cancelled() const { return cancelled_; }

        //---Чтение завершилось ошибкой (а не концом ввода)
        bool failed() const { return failed_; }
        std::uint32_t sysError() const { return sysError_; }

        void close();

    private:
        bool fill();

        NativeHandle handle_ = kInvalidHandle;
        std::string buf_;
        bool eof_ = false;
        bool failed_ = false;
        bool cancelled_ = false;
        int drained_ = 0;                   // Порции, прочитанные после отмены
        std::uint32_t sysError_ = 0;
        const std::atomic<bool>* cancel_ = nullptr;
    };

    class ChildProcess;

    //---Запускает внешний процесс и сразу возвращает управление
    //
    // Параметры:
    //   exe - исполняемый файл; имя без каталога ищется в PATH
    //   args - аргументы командной строки (без argv[0]), передаются без изменений
    //   child - запущенный процесс (каналы по opt.stdoutMode / opt.stderrMode)
    //   sysError - код системной ошибки при неудаче (опционально)
    // Возвращает:
    //   false - если процесс не удалось запустить (в т.ч. exe не найден)
    bool spawn(const fs::path& exe, const std::vector<std::string>& args,
        ChildProcess& child, std::uint32_t* sysError, const RunOptions& opt = {});

    //---Запущенный дочерний процесс. Единственный владелец, только перемещение.
    class ChildProcess final {
    public:
        ChildProcess() = default;
        ~ChildProcess();

        ChildProcess(ChildProcess&& other) noexcept;
        ChildProcess& operator=(ChildProcess&& other) noexcept;
        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        bool valid() const { return process_ != kInvalidHandle; }
        std::int64_t pid() const { return pid_; }

        //---Каналы stdout/stderr (валидны только при Stdio::Capture)
        PipeReader& stdoutPipe() { return out_; }
        PipeReader& stderrPipe() { return err_; }

        //---Ожидание завершения. Статус фиксируется один раз, повторный вызов
        //   возвращает сохранённый результат.
        bool wait(RunResult& out);

        bool finished() const { return finished_; }

    private:
        friend bool spawn(const fs::path& exe, const std::vector<std::string>& args,
            ChildProcess& child, std::uint32_t* sysError, const RunOptions& opt);

        void release();

        std::int64_t pid_ = 0;
        NativeHandle process_ = kInvalidHandle;   // pid на Linux, HANDLE процесса на Windows
        PipeReader out_;
        PipeReader err_;
        bool finished_ = false;
        RunResult status_;
    };

    //---Запускает внешний процесс и ждёт его завершения
    //
    // Возвращает:
    //   true - если процесс успешно запущен и завершился (независимо от exitCode)
    //   false - если произошла ошибка при запуске или ожидании процесса
    // Примечание:
    //   Захваченный вывод (Stdio::Capture) сохраняется в out.output / out.errorOutput
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

} // namespace bklaunch::process
