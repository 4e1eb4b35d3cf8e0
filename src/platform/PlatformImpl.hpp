#pragma once
#include <filesystem>
#include <string>

#include "backend_launcher/CommandSpec.hpp"

namespace bklaunch {

	enum class ScriptFlavor;

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Команда нативного диалога да/нет: печатает в stdout "Yes" или "No",
		//   ненулевой код завершения - диалог показать не удалось
		CommandSpec dialogCommand(const std::string& title, const std::string& message);
		//---Обёртка команды для видимого блокирующего запуска (отдельное окно терминала, если нужно)
		CommandSpec visibleCommand(const CommandSpec& inner);
		//---Тип скрипта установки
		ScriptFlavor scriptFlavor();
	}

} // namespace bklaunch
