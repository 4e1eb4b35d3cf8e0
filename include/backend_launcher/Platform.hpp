#pragma once
#include <filesystem>
#include <memory>

namespace bklaunch {

	namespace fs = std::filesystem;

	class IConsentPrompt;
	class ITerminalHost;
	enum class ScriptFlavor;

	//---Путь к собственному исполняемому файлу (пустой, если не удалось определить)
	fs::path selfExePath();

	//---Нативный диалог да/нет для текущей платформы
	std::unique_ptr<IConsentPrompt> makeConsentPrompt();

	//---Видимый терминал для текущей платформы
	std::unique_ptr<ITerminalHost> makeTerminalHost();

	//---Тип скрипта установки для текущей платформы
	ScriptFlavor nativeScriptFlavor();

};//---namespace bklaunch
