#include "backend_launcher/DependencyProbe.hpp"
#include "backend_launcher/LaunchLog.hpp"
#include "backend_launcher/Process.hpp"
#include "backend_launcher/Strings.hpp"

#include <system_error>

namespace bklaunch {

	const char* toString(ProbeResult r)
	{
		switch (r)
		{
		case ProbeResult::Ok: return "ok";
		case ProbeResult::Missing: return "missing";
		case ProbeResult::Indeterminate: return "indeterminate";
		}
		return "unknown";
	}

	std::string buildProbeScript(const std::vector<std::string>& modules)
	{
		std::string script =
			"import sys\n"
			"try:\n";
		if (!modules.empty())
			script += "    import " + joinList(modules) + "\n";
		else
			script += "    pass\n";
		script +=
			"except ImportError:\n"
			"    sys.exit(1)\n";
		return script;
	}

	ProbeResult probeDependencies(const LaunchConfig& cfg, LaunchLog& log)
	{
		log.info("Launcher: Performing pre-flight dependency check...");

		process::RunOptions opt;
		opt.stdoutMode = process::Stdio::Null;
		opt.stderrMode = process::Stdio::Null;

		process::RunResult rr;
		const bool ok = process::run(fs::path(cfg.interpreter), { "-c", buildProbeScript(cfg.requiredModules) }, rr, opt);

		//---Проверка не запустилась: окружение неизвестно, запуск продолжается
		if (!rr.started)
		{
			log.warning("Launcher: Failed to run " + cfg.interpreter + " check script (" +
				std::system_category().message((int)rr.sysError) + "). Is python installed?");
			return ProbeResult::Indeterminate;
		}
		if (!ok)
		{
			log.warning("Launcher: Dependency check did not complete (wait failed). Continuing.");
			return ProbeResult::Indeterminate;
		}

		if (rr.exited && rr.exitCode == 0)
		{
			log.info("Launcher: Dependencies look OK.");
			return ProbeResult::Ok;
		}

		if (rr.exited)
			log.info("Launcher: Missing dependencies (check exited with code " + std::to_string(rr.exitCode) + ").");
		else
			log.info("Launcher: Missing dependencies (check terminated by signal " + std::to_string(rr.termSignal) + ").");
		return ProbeResult::Missing;
	}

};//---namespace bklaunch
