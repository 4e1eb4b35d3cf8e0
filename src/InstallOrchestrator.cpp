#include "backend_launcher/InstallOrchestrator.hpp"
#include "backend_launcher/IConsentPrompt.hpp"
#include "backend_launcher/ITerminalHost.hpp"
#include "backend_launcher/LaunchLog.hpp"
#include "backend_launcher/Manifest.hpp"

#include <system_error>

namespace bklaunch {

	const char* toString(InstallDecision d)
	{
		switch (d)
		{
		case InstallDecision::NotNeeded: return "not needed";
		case InstallDecision::UserDeclined: return "user declined";
		case InstallDecision::UserApproved: return "user approved";
		case InstallDecision::PromptFailed: return "prompt failed";
		}
		return "unknown";
	}

	const char* toString(InstallOutcome o)
	{
		switch (o)
		{
		case InstallOutcome::NotAttempted: return "not attempted";
		case InstallOutcome::ManifestMissing: return "manifest missing";
		case InstallOutcome::ScriptFailed: return "installer script failed";
		case InstallOutcome::Succeeded: return "succeeded";
		case InstallOutcome::Failed: return "failed";
		}
		return "unknown";
	}

	InstallOrchestrator::InstallOrchestrator(const LaunchConfig& cfg, IConsentPrompt& prompt,
		ITerminalHost& terminal, LaunchLog& log, ScriptFlavor flavor)
		: cfg_(cfg), prompt_(prompt), terminal_(terminal), log_(log), flavor_(flavor)
	{
	}
	//------------------------------------------------------------
	//	Шаг 1: согласие пользователя
	//------------------------------------------------------------
	InstallDecision InstallOrchestrator::decide(ProbeResult probe)
	{
		if (probe != ProbeResult::Missing) return InstallDecision::NotNeeded;

		log_.info("Launcher: Missing dependencies. Prompting user...");

		std::string err;
		const ConsentAnswer answer = prompt_.ask(cfg_.dialogTitle, cfg_.dialogMessage, &err);
		switch (answer)
		{
		case ConsentAnswer::Yes:
			log_.info("Launcher: User response: Yes");
			return InstallDecision::UserApproved;
		case ConsentAnswer::No:
			log_.info("Launcher: User declined installation. Backend will likely fail.");
			return InstallDecision::UserDeclined;
		case ConsentAnswer::Failed:
			break;
		}

		//---Диалог не показан: установка не выполняется, запуск продолжается
		log_.warning("Launcher: Failed to show dialog: " + (err.empty() ? std::string("unknown error") : err));
		return InstallDecision::PromptFailed;
	}
	//------------------------------------------------------------
	//	Шаги 2-6: манифест, скрипт, видимый терминал, очистка
	//------------------------------------------------------------
	InstallOutcome InstallOrchestrator::install(const fs::path& backendDir)
	{
		log_.info("Launcher: Starting dependency installation...");

		//---2) Манифест зависимостей
		DependencyManifest manifest;
		manifest.sourcePath = backendDir / cfg_.manifestName;

		std::error_code ec;
		if (!fs::exists(manifest.sourcePath, ec))
		{
			log_.warning("Launcher: Warning: " + cfg_.manifestName + " not found in " + backendDir.string());
			return InstallOutcome::ManifestMissing;
		}

		//---3) Копия без защищённых пакетов; при ошибке - исходный манифест
		manifest.filteredPath = backendDir / cfg_.filteredManifestName;

		std::string err;
		bool madeFiltered = writeFilteredManifest(manifest, cfg_.protectedPackages, &err);
		if (madeFiltered)
		{
			log_.info("Launcher: Filtered manifest written to " + manifest.filteredPath.string() +
				" (" + std::to_string(manifest.filteredEntries.size()) + " entries kept)");
		}
		else
		{
			log_.warning("Launcher: Failed to filter manifest (" + err + "). Installing from " +
				manifest.sourcePath.string());
		}
		const fs::path target = madeFiltered ? manifest.filteredPath : manifest.sourcePath;

		//---4) Скрипт установки
		log_.info("Launcher: Creating installation script...");
		const InstallerScript script = makeInstallerScript(backendDir, target, cfg_.packageManager, flavor_);

		InstallOutcome outcome = InstallOutcome::ScriptFailed;
		err.clear();
		if (!writeInstallerScript(script, &err))
		{
			log_.warning("Launcher: Failed to write installer script: " + err);
		}
		else
		{
			//---5) Видимый блокирующий сеанс
			log_.info("Launcher: Running installer script " + script.path.string());

			int code = 0;
			err.clear();
			if (!terminal_.runVisible(scriptCommand(script), &code, &err))
			{
				log_.warning("Launcher: Failed to run installer script: " + err);
			}
			else if (code == 0)
			{
				log_.info("Launcher: Installer finished successfully.");
				outcome = InstallOutcome::Succeeded;
			}
			else
			{
				log_.warning("Launcher: Installer exited with code " + std::to_string(code));
				outcome = InstallOutcome::Failed;
			}
		}

		//---6) Очистка временных файлов при любом исходе
		removeArtifact(script.path, "installer script");
		if (madeFiltered || fs::exists(manifest.filteredPath, ec))
			removeArtifact(manifest.filteredPath, "filtered manifest");

		return outcome;
	}

	InstallOutcome InstallOrchestrator::run(ProbeResult probe, const fs::path& backendDir)
	{
		const InstallDecision d = decide(probe);
		if (d != InstallDecision::NotNeeded)
			log_.info(std::string("Launcher: Install decision: ") + toString(d));
		if (d != InstallDecision::UserApproved) return InstallOutcome::NotAttempted;
		return install(backendDir);
	}

	//---Удаление временного файла (best-effort, ошибка только в журнал)
	void InstallOrchestrator::removeArtifact(const fs::path& p, const char* what)
	{
		std::error_code ec;
		fs::remove(p, ec);
		if (ec)
		{
			log_.warning(std::string("Launcher: Failed to delete ") + what + " " + p.string() + ": " + ec.message());
		}
	}

};//---namespace bklaunch
