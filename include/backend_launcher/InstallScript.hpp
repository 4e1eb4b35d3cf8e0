#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "backend_launcher/CommandSpec.hpp"

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Тип скрипта установки
	enum class ScriptFlavor {
		Posix,		//	/bin/sh (install_deps.sh)
		Batch		//	cmd.exe (install_deps.bat)
	};

	//---Сгенерированный скрипт установки зависимостей (только данные)
	struct InstallerScript final {
		fs::path path;
		ScriptFlavor flavor = ScriptFlavor::Posix;
		std::string content;
	};

	//---Имя файла скрипта для типа
	std::string installerScriptName(ScriptFlavor flavor);

	//---Строка в одинарных кавычках для /bin/sh
	std::string shellQuote(std::string_view s);

	//---Генерация скрипта: печатает цель, запускает "<packageManager> install -r <manifest>",
	//   при ошибке - сообщение, пауза до подтверждения пользователя и выход с кодом ошибки;
	//   при успехе - подтверждение и пауза 5 секунд
	InstallerScript makeInstallerScript(const fs::path& dir, const fs::path& manifest,
		const std::string& packageManager, ScriptFlavor flavor);

	//---Запись скрипта на диск (Posix: с правом на выполнение)
	bool writeInstallerScript(const InstallerScript& script, std::string* error);

	//---Команда исполнения скрипта (sh <script> / cmd /c <script>)
	CommandSpec scriptCommand(const InstallerScript& script);

};//---namespace bklaunch
