#include "backend_launcher/Process.hpp"
#include "platform/ProcessImpl.hpp"

#include <thread>
#include <utility>

namespace bklaunch::process {

    //---Период проверки флага отмены при ожидании данных канала
    static constexpr int kCancelPollMs = 100;
    //---После отмены дочитывается не больше этого числа порций (4 КиБ каждая)
    static constexpr int kCancelDrainChunks = 16;

    //------------------------------------------------------------
    //  PipeReader
    //------------------------------------------------------------
    PipeReader::~PipeReader()
    {
        close();
    }

    PipeReader::PipeReader(PipeReader&& other) noexcept
        : handle_(std::exchange(other.handle_, kInvalidHandle)),
          buf_(std::move(other.buf_)),
          eof_(other.eof_),
          failed_(other.failed_),
          cancelled_(other.cancelled_),
          drained_(other.drained_),
          sysError_(other.sysError_),
          cancel_(std::exchange(other.cancel_, nullptr))
    {
    }

    PipeReader& PipeReader::operator=(PipeReader&& other) noexcept
    {
        if (this != &other)
        {
            close();
            handle_ = std::exchange(other.handle_, kInvalidHandle);
            buf_ = std::move(other.buf_);
            eof_ = other.eof_;
            failed_ = other.failed_;
            cancelled_ = other.cancelled_;
            drained_ = other.drained_;
            sysError_ = other.sysError_;
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    void PipeReader::close()
    {
        if (handle_ != kInvalidHandle)
        {
            detail::closePipePlatform(handle_);
            handle_ = kInvalidHandle;
        }
    }

    //---Дочитать порцию данных в буфер; false - конец ввода или ошибка
    bool PipeReader::fill()
    {
        if (eof_ || handle_ == kInvalidHandle) return false;

        //---С флагом отмены read не вызывается, пока в канале нет данных
        if (cancel_)
        {
            for (;;)
            {
                const bool stopping = cancel_->load();
                if (stopping && drained_ >= kCancelDrainChunks)
                {
                    cancelled_ = true;
                    eof_ = true;
                    return false;
                }
                const int r = detail::waitReadablePlatform(handle_, stopping ? 0 : kCancelPollMs, sysError_);
                if (r > 0)
                {
                    if (stopping) ++drained_;
                    break;
                }
                if (r < 0)
                {
                    failed_ = true;
                    eof_ = true;
                    return false;
                }
                if (stopping)
                {
                    cancelled_ = true;
                    eof_ = true;
                    return false;
                }
            }
        }

        char chunk[4096];
        const long long n = detail::readPipePlatform(handle_, chunk, sizeof(chunk), sysError_);
        if (n > 0)
        {
            buf_.append(chunk, static_cast<std::size_t>(n));
            return true;
        }

        //---n == 0 - писатель закрыл канал, n < 0 - ошибка чтения
        if (n < 0) failed_ = true;
        eof_ = true;
        return false;
    }

    bool PipeReader::readLine(std::string& line)
    {
        for (;;)
        {
            const auto pos = buf_.find('\n');
            if (pos != std::string::npos)
            {
                line.assign(buf_, 0, pos);
                buf_.erase(0, pos + 1);
                break;
            }
            if (!fill())
            {
                //---Последняя строка без перевода строки
                if (buf_.empty()) return false;
                line = std::move(buf_);
                buf_.clear();
                break;
            }
        }

        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    std::string PipeReader::readAll()
    {
        while (fill()) {}
        std::string out = std::move(buf_);
        buf_.clear();
        return out;
    }

    //------------------------------------------------------------
    //  ChildProcess
    //------------------------------------------------------------
    ChildProcess::~ChildProcess()
    {
        release();
    }

    ChildProcess::ChildProcess(ChildProcess&& other) noexcept
        : pid_(std::exchange(other.pid_, 0)),
          process_(std::exchange(other.process_, kInvalidHandle)),
          out_(std::move(other.out_)),
          err_(std::move(other.err_)),
          finished_(other.finished_),
          status_(std::move(other.status_))
    {
    }

    ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept
    {
        if (this != &other)
        {
            release();
            pid_ = std::exchange(other.pid_, 0);
            process_ = std::exchange(other.process_, kInvalidHandle);
            out_ = std::move(other.out_);
            err_ = std::move(other.err_);
            finished_ = other.finished_;
            status_ = std::move(other.status_);
        }
        return *this;
    }

    void ChildProcess::release()
    {
        out_.close();
        err_.close();
        if (process_ != kInvalidHandle)
        {
            detail::releaseProcessPlatform(process_);
            process_ = kInvalidHandle;
        }
    }

    bool ChildProcess::wait(RunResult& out)
    {
        //---Статус завершения фиксируется ровно один раз
        if (finished_)
        {
            out.started = status_.started;
            out.exited = status_.exited;
            out.exitCode = status_.exitCode;
            out.termSignal = status_.termSignal;
            out.sysError = status_.sysError;
            return true;
        }
        if (process_ == kInvalidHandle) return false;

        RunResult st;
        st.started = true;
        if (!detail::waitPlatform(process_, st))
        {
            out.started = true;
            out.sysError = st.sysError;
            return false;
        }

        status_ = st;
        finished_ = true;

        out.started = status_.started;
        out.exited = status_.exited;
        out.exitCode = status_.exitCode;
        out.termSignal = status_.termSignal;
        out.sysError = status_.sysError;
        return true;
    }

    //------------------------------------------------------------
    //  spawn / run
    //------------------------------------------------------------
    bool spawn(const fs::path& exe, const std::vector<std::string>& args,
        ChildProcess& child, std::uint32_t* sysError, const RunOptions& opt)
    {
        child = ChildProcess{};

        detail::SpawnedHandles h;
        std::uint32_t err = 0;
        if (!detail::spawnPlatform(exe, args, opt, h, err))
        {
            if (sysError) *sysError = err;
            return false;
        }

        child.pid_ = h.pid;
        child.process_ = h.process;
        child.out_ = PipeReader(h.out);
        child.err_ = PipeReader(h.err);
        return true;
    }

    // Синхронный запуск поверх spawn: захваченные каналы вычитываются до конца
    // (stderr - в отдельном потоке, чтобы дочерний процесс не блокировался на записи)
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        ChildProcess child;
        if (!spawn(exe, args, child, &out.sysError, opt))
        {
            out.started = false;
            out.exitCode = static_cast<int>(out.sysError);
            return false;
        }
        out.started = true;

        std::string errText;
        std::thread errReader;
        if (child.stderrPipe().valid())
        {
            errReader = std::thread([&child, &errText] { errText = child.stderrPipe().readAll(); });
        }
        if (child.stdoutPipe().valid())
        {
            out.output = child.stdoutPipe().readAll();
        }
        if (errReader.joinable()) errReader.join();
        out.errorOutput = std::move(errText);

        return child.wait(out);
    }

} // namespace bklaunch::process
