#include "backend_launcher/Launcher.hpp"
#include "backend_launcher/DependencyProbe.hpp"
#include "backend_launcher/InstallOrchestrator.hpp"
#include "backend_launcher/LaunchLog.hpp"
#include "backend_launcher/Paths.hpp"
#include "backend_launcher/ProcessSupervisor.hpp"

namespace bklaunch {

	//------------------------------------------------------------
	//	Оркестратор: запуск бэкенда с подготовкой окружения
	//------------------------------------------------------------
	int runLauncher(LaunchContext& ctx, const LaunchConfig& cfg, LauncherServices& svc) {

		LaunchLog& log = svc.log;

		log.info("Launcher: Starting backend wrapper...");
		log.info("Launcher: Executable at " + ctx.executableLocation.string());
		log.info("Launcher: Executable Dir at " + ctx.executableDirectory.string());
		for (const auto& line : describeConfig(cfg))
		{
			log.info("Launcher: Config " + line);
		}

		//---1) Каталог бэкенда: без него запуск невозможен (фатально)
		if (!resolveBackend(ctx, cfg, log)) return 1;

		const fs::path backendDir = *ctx.resolvedBackendPath;
		log.info("Launcher: Setting CWD to " + ctx.workingDirectory.string());

		//---2) Проверка зависимостей (результат только рекомендательный)
		const ProbeResult probe = probeDependencies(cfg, log);

		//---3) Согласие и установка; любой исход ведёт к запуску бэкенда
		InstallOrchestrator installer(cfg, svc.prompt, svc.terminal, log, svc.scriptFlavor);
		const InstallOutcome outcome = installer.run(probe, backendDir);
		if (outcome != InstallOutcome::NotAttempted)
		{
			log.info(std::string("Launcher: Dependency installation ") + toString(outcome) + ".");
		}

		//---4) Запуск и сопровождение бэкенда
		ProcessSupervisor supervisor(cfg, log, svc.out, svc.err);
		return supervisor.run(ctx);
	}
}; //---namespace bklaunch
