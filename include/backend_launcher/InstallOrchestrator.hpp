#pragma once
#include <filesystem>

#include "backend_launcher/Config.hpp"
#include "backend_launcher/DependencyProbe.hpp"
#include "backend_launcher/InstallScript.hpp"

namespace bklaunch {

	namespace fs = std::filesystem;

	class IConsentPrompt;
	class ITerminalHost;
	class LaunchLog;

	//---Решение об установке зависимостей
	enum class InstallDecision {
		NotNeeded,		//	Проверка не сообщила об отсутствующих пакетах
		UserDeclined,
		UserApproved,
		PromptFailed	//	Диалог не удалось показать: установка не выполняется
	};

	//---Итог попытки установки
	enum class InstallOutcome {
		NotAttempted,		//	Решение не UserApproved
		ManifestMissing,	//	Нет requirements.txt в каталоге бэкенда
		ScriptFailed,		//	Скрипт не записан или терминал не запустился
		Succeeded,			//	Сеанс установки завершился с кодом 0
		Failed				//	Сеанс установки завершился с ошибкой
	};

	const char* toString(InstallDecision d);
	const char* toString(InstallOutcome o);

	//---Оркестратор установки: согласие пользователя → фильтрация манифеста →
	//   скрипт установки в видимом терминале → очистка временных файлов.
	//   Ни один шаг не прерывает запуск бэкенда; повторная проверка не выполняется.
	class InstallOrchestrator final {
	public:
		InstallOrchestrator(const LaunchConfig& cfg, IConsentPrompt& prompt, ITerminalHost& terminal,
			LaunchLog& log, ScriptFlavor flavor);

		//---Вопрос пользователю задаётся только при ProbeResult::Missing
		InstallDecision decide(ProbeResult probe);

		//---Установка из манифеста в backendDir (шаги 2-6)
		InstallOutcome install(const fs::path& backendDir);

		//---decide + install при UserApproved
		InstallOutcome run(ProbeResult probe, const fs::path& backendDir);

	private:
		void removeArtifact(const fs::path& p, const char* what);

		const LaunchConfig& cfg_;
		IConsentPrompt& prompt_;
		ITerminalHost& terminal_;
		LaunchLog& log_;
		ScriptFlavor flavor_;
	};

};//---namespace bklaunch
