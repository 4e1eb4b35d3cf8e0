#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "backend_launcher/Config.hpp"
#include "backend_launcher/LaunchContext.hpp"

namespace bklaunch {

	namespace fs = std::filesystem;

	class LaunchLog;

	//---Контекст запуска: расположение лаунчера и пересылаемые аргументы (argv[1..]).
	//   Если путь лаунчера не определён → каталог лаунчера = текущая директория
	LaunchContext makeLaunchContext(const fs::path& exePath, int argc, const char* const* argv);

	//---Кандидаты каталога бэкенда в порядке приоритета:
	//	 <exeDir>/resources/backend, <exeDir>/backend,
	//	 <exeDir>/../resources/backend, <exeDir>/../backend
	std::vector<fs::path> candidateBackendPaths(const fs::path& exeDir, const LaunchConfig& cfg);

	//---Поиск каталога бэкенда: первый существующий кандидат.
	//	 Заполняет resolvedBackendPath и workingDirectory (родитель каталога бэкенда).
	//	 Уже найденный путь повторно не ищется.
	//	 false → ни один кандидат не существует (фатально для лаунчера)
	bool resolveBackend(LaunchContext& ctx, const LaunchConfig& cfg, LaunchLog& log);

};//---namespace bklaunch
