#include "backend_launcher/ProcessSupervisor.hpp"
#include "backend_launcher/LaunchLog.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>

namespace bklaunch {

	int launcherExitCode(const process::RunResult& status)
	{
		//---Убит сигналом / код недоступен → 1
		return status.exited ? status.exitCode : 1;
	}

	ProcessSupervisor::ProcessSupervisor(const LaunchConfig& cfg, LaunchLog& log, std::ostream& out, std::ostream& err)
		: cfg_(cfg), log_(log), out_(out), err_(err)
	{
	}

	std::vector<std::string> ProcessSupervisor::buildArguments(const std::vector<std::string>& forwarded) const
	{
		std::vector<std::string> args;
		args.reserve(forwarded.size() + 2);
		args.push_back("-m");
		args.push_back(cfg_.module);
		args.insert(args.end(), forwarded.begin(), forwarded.end());
		return args;
	}

	//------------------------------------------------------------
	//	Пересылка одного потока до конца ввода (выполняется в своём потоке)
	//------------------------------------------------------------
	void ProcessSupervisor::relay(process::PipeReader& pipe, const char* prefix, std::ostream& dst)
	{
		std::string line;
		while (pipe.readLine(line))
		{
			log_.info(std::string(prefix) + ": " + line);
			dst << line << '\n';
			dst.flush();
		}
		if (pipe.failed())
		{
			log_.warning(std::string("Launcher: ") + prefix + " read failed: " +
				std::system_category().message((int)pipe.sysError()));
		}
	}

	int ProcessSupervisor::run(const LaunchContext& ctx)
	{
		const std::vector<std::string> args = buildArguments(ctx.forwardedArgs);

		{
			std::ostringstream os;
			os << "Launcher: Running '" << cfg_.interpreter << " -m " << cfg_.module << "' with args: [";
			for (size_t i = 0; i < ctx.forwardedArgs.size(); i++)
			{
				if (i) os << ", ";
				os << '"' << ctx.forwardedArgs[i] << '"';
			}
			os << "]";
			log_.info(os.str());
		}

		process::RunOptions opt;
		opt.workingDir = ctx.workingDirectory;
		opt.stdoutMode = process::Stdio::Capture;
		opt.stderrMode = process::Stdio::Capture;

		process::ChildProcess child;
		std::uint32_t sysError = 0;
		if (!process::spawn(fs::path(cfg_.interpreter), args, child, &sysError, opt))
		{
			log_.error("Launcher: Failed to spawn " + cfg_.interpreter + " process: " +
				std::system_category().message((int)sysError));
			log_.error("Make sure '" + cfg_.interpreter + "' is in your system PATH.");
			return 1;
		}
		spawned_ = true;
		log_.info("Launcher: Process spawned (pid " + std::to_string(child.pid()) + "). Monitoring output...");

		//---Флаг останавливает читателей, если каналы остались открыты после завершения бэкенда
		std::atomic<bool> stopReaders{ false };
		child.stdoutPipe().setCancelFlag(&stopReaders);
		child.stderrPipe().setCancelFlag(&stopReaders);

		//---Два независимых читателя; порядок сохраняется только внутри потока
		std::promise<void> outDone;
		std::promise<void> errDone;
		std::future<void> outFinished = outDone.get_future();
		std::future<void> errFinished = errDone.get_future();
		std::thread outReader([this, &child, &outDone] {
			relay(child.stdoutPipe(), "STDOUT", out_);
			outDone.set_value();
		});
		std::thread errReader([this, &child, &errDone] {
			relay(child.stderrPipe(), "STDERR", err_);
			errDone.set_value();
		});

		process::RunResult status;
		const bool waited = child.wait(status);

		//---Обычно читатели завершаются сами по концу ввода. Если пишущий конец
		//   унаследовал потомок бэкенда, ждём не дольше outputGraceMs
		const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.outputGraceMs);
		const bool drained =
			outFinished.wait_until(deadline) == std::future_status::ready &&
			errFinished.wait_until(deadline) == std::future_status::ready;
		if (!drained)
		{
			log_.warning("Launcher: Output streams still open " + std::to_string(cfg_.outputGraceMs) +
				" ms after the process ended (held by a background process?). Stopping output relay.");
			stopReaders = true;
		}

		outReader.join();
		errReader.join();

		if (!waited)
		{
			log_.error("Launcher: Failed to wait on child process: " +
				std::system_category().message((int)status.sysError));
			return 1;
		}

		if (status.exited)
			log_.info("Launcher: Process exited with code " + std::to_string(status.exitCode));
		else
			log_.info("Launcher: Process terminated by signal " + std::to_string(status.termSignal));

		return launcherExitCode(status);
	}

};//---namespace bklaunch
