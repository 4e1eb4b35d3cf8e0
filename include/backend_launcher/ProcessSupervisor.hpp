#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "backend_launcher/Config.hpp"
#include "backend_launcher/LaunchContext.hpp"
#include "backend_launcher/Process.hpp"

namespace bklaunch {

	class LaunchLog;

	//---Код завершения лаунчера по статусу дочернего процесса:
	//   собственный код при нормальном завершении, иначе 1
	int launcherExitCode(const process::RunResult& status);

	//---Запуск бэкенда и сопровождение до его завершения.
	//   stdout/stderr бэкенда читаются двумя потоками построчно: каждая строка
	//   пишется в журнал ("STDOUT: " / "STDERR: ") и пересылается в out / err.
	class ProcessSupervisor final {
	public:
		ProcessSupervisor(const LaunchConfig& cfg, LaunchLog& log, std::ostream& out, std::ostream& err);

		//---Аргументы интерпретатора: -m <module> <forwarded...>
		std::vector<std::string> buildArguments(const std::vector<std::string>& forwarded) const;

		//---Блокирует до завершения бэкенда. Возвращает код завершения лаунчера;
		//   1, если процесс не удалось запустить (spawned() == false)
		int run(const LaunchContext& ctx);

		bool spawned() const { return spawned_; }

	private:
		void relay(process::PipeReader& pipe, const char* prefix, std::ostream& dst);

		const LaunchConfig& cfg_;
		LaunchLog& log_;
		std::ostream& out_;
		std::ostream& err_;
		bool spawned_ = false;
	};

};//---namespace bklaunch
