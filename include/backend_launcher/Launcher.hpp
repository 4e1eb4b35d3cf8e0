#pragma once
#include <ostream>

#include "backend_launcher/Config.hpp"
#include "backend_launcher/InstallScript.hpp"
#include "backend_launcher/LaunchContext.hpp"

namespace bklaunch {

	class IConsentPrompt;
	class ITerminalHost;
	class LaunchLog;

	//---Внешние коллабораторы лаунчера (в тестах подменяются)
	struct LauncherServices final {
		LaunchLog& log;
		IConsentPrompt& prompt;
		ITerminalHost& terminal;
		std::ostream& out;				//	Пересылка stdout бэкенда
		std::ostream& err;				//	Пересылка stderr бэкенда
		ScriptFlavor scriptFlavor;
	};

	//---Оркестратор: поиск бэкенда → проверка зависимостей → (согласие → установка) → запуск.
	//	 Возвращает код завершения процесса лаунчера:
	//	 код бэкенда; 1 - бэкенд не найден, не запустился или завершён аварийно
	int runLauncher(LaunchContext& ctx, const LaunchConfig& cfg, LauncherServices& svc);

};//---namespace bklaunch
