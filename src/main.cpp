#include <iostream>
#include <memory>
#include <string>
#include <glog/logging.h>

#include "backend_launcher/Config.hpp"
#include "backend_launcher/IConsentPrompt.hpp"
#include "backend_launcher/ITerminalHost.hpp"
#include "backend_launcher/LaunchLog.hpp"
#include "backend_launcher/Launcher.hpp"
#include "backend_launcher/Logging.hpp"
#include "backend_launcher/Paths.hpp"
#include "backend_launcher/Platform.hpp"

int main(int argc, char** argv) {

	//---Настройки (только окружение: все аргументы принадлежат бэкенду)
	const bklaunch::LaunchConfig cfg = bklaunch::loadConfig(bklaunch::systemEnv());

	//---Инициализация логгера
	bklaunch::initLogging(argv[0], cfg);

	//---Журнал запуска: новый при каждом запуске
	bklaunch::FileLaunchLog log;
	std::string err;
	if (!log.open(cfg.logPath, &err))
	{
		LOG(WARNING) << err << " (continuing without launch log)";
	}

	bklaunch::LaunchContext ctx = bklaunch::makeLaunchContext(bklaunch::selfExePath(), argc, argv);
	if (ctx.executableLocation.empty())
	{
		log.warning("Launcher: Could not determine executable path, using current directory");
	}

	//---Коллабораторы текущей платформы
	const std::unique_ptr<bklaunch::IConsentPrompt> prompt = bklaunch::makeConsentPrompt();
	const std::unique_ptr<bklaunch::ITerminalHost> terminal = bklaunch::makeTerminalHost();

	bklaunch::LauncherServices svc{ log, *prompt, *terminal, std::cout, std::cerr, bklaunch::nativeScriptFlavor() };

	//---Код завершения лаунчера = код завершения бэкенда
	return bklaunch::runLauncher(ctx, cfg, svc);
}
