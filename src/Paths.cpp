#include "backend_launcher/Paths.hpp"
#include "backend_launcher/LaunchLog.hpp"

#include <system_error>

namespace bklaunch {

	//---Контекст запуска
	LaunchContext makeLaunchContext(const fs::path& exePath, int argc, const char* const* argv) {

		LaunchContext ctx;
		ctx.executableLocation = exePath;

		if (!exePath.empty())
		{
			ctx.executableDirectory = exePath.parent_path();
		}
		else
		{
			std::error_code ec;
			ctx.executableDirectory = fs::current_path(ec);
		}

		//---Все аргументы после имени лаунчера пересылаются как есть
		for (int i = 1; i < argc; i++)
		{
			ctx.forwardedArgs.emplace_back(argv[i]);
		}
		return ctx;
	}
	//---Кандидаты каталога бэкенда
	std::vector<fs::path> candidateBackendPaths(const fs::path& exeDir, const LaunchConfig& cfg) {

		//---Уровнем выше (лаунчер вложен в платформенный каталог bin/...).
		//   У корня родителя нет → используется сам каталог
		const fs::path up = exeDir.has_relative_path() ? exeDir.parent_path() : exeDir;

		return {
			exeDir / cfg.resourcesDirName / cfg.backendDirName,		//	Установленная раскладка
			exeDir / cfg.backendDirName,							//	Плоская раскладка / разработка
			up / cfg.resourcesDirName / cfg.backendDirName,
			up / cfg.backendDirName,
		};
	}
	//---Поиск каталога бэкенда
	bool resolveBackend(LaunchContext& ctx, const LaunchConfig& cfg, LaunchLog& log) {

		//---Найденный путь не пересматривается в пределах запуска
		if (ctx.resolvedBackendPath) return true;

		ctx.candidateBackendPaths = candidateBackendPaths(ctx.executableDirectory, cfg);

		for (const auto& p : ctx.candidateBackendPaths)
		{
			std::error_code ec;
			if (fs::exists(p, ec))
			{
				log.info("Launcher: Found backend at " + p.string());
				ctx.resolvedBackendPath = p;
				ctx.workingDirectory = p.parent_path();
				return true;
			}
			log.info("Launcher: Checked " + p.string() + " (not found)");
		}

		log.error("Error: '" + cfg.backendDirName + "' directory not found in any expected location.");
		return false;
	}
} // namespace bklaunch
