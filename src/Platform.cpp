#include "backend_launcher/Platform.hpp"
#include "backend_launcher/IConsentPrompt.hpp"
#include "backend_launcher/ITerminalHost.hpp"
#include "backend_launcher/InstallScript.hpp"
#include "backend_launcher/Process.hpp"
#include "backend_launcher/Strings.hpp"
#include "platform/PlatformImpl.hpp"

#include <sstream>
#include <glog/logging.h>

namespace bklaunch {

	namespace {
		//------------------------------------------------------------
		//	Нативный диалог: команда платформы печатает ответ в stdout
		//------------------------------------------------------------
		class NativeDialogPrompt final : public IConsentPrompt {
		public:
			ConsentAnswer ask(const std::string& title, const std::string& message, std::string* error) override
			{
				const CommandSpec cmd = platform::dialogCommand(title, message);

				process::RunOptions opt;
				opt.stdoutMode = process::Stdio::Capture;
				opt.stderrMode = process::Stdio::Inherit;

				process::RunResult rr;
				const bool ok = process::run(cmd.program, cmd.args, rr, opt);
				if (!ok || !rr.started)
				{
					if (error)
					{
						std::ostringstream os;
						os << "failed to start " << cmd.program.string() << ". sysError=" << rr.sysError;
						*error = os.str();
					}
					return ConsentAnswer::Failed;
				}
				if (!rr.exited || rr.exitCode != 0)
				{
					if (error)
					{
						std::ostringstream os;
						os << cmd.program.string() << " exitCode=" << rr.exitCode;
						if (!rr.exited) os << " (signal " << rr.termSignal << ")";
						*error = os.str();
					}
					return ConsentAnswer::Failed;
				}

				LOG(INFO) << "Dialog answer: " << std::string(trimView(rr.output));
				return isAffirmative(rr.output) ? ConsentAnswer::Yes : ConsentAnswer::No;
			}
		};
		//------------------------------------------------------------
		//	Видимый терминал: обёртка платформы + блокирующий запуск
		//------------------------------------------------------------
		class VisibleTerminalHost final : public ITerminalHost {
		public:
			bool runVisible(const CommandSpec& inner, int* exitCode, std::string* error) override
			{
				const CommandSpec cmd = platform::visibleCommand(inner);

				process::RunOptions opt;
				opt.workingDir = cmd.workingDir;
				opt.hideWindow = false;

				process::RunResult rr;
				if (!process::run(cmd.program, cmd.args, rr, opt))
				{
					if (error)
					{
						std::ostringstream os;
						os << "failed to run " << cmd.program.string() << ". sysError=" << rr.sysError;
						*error = os.str();
					}
					return false;
				}
				if (exitCode) *exitCode = rr.exited ? rr.exitCode : 1;
				return true;
			}
		};
	} // namespace

	//------------------------------------------------------------
	//	Ответ диалога
	//------------------------------------------------------------
	bool isAffirmative(std::string_view dialogOutput) {
		return trimView(dialogOutput) == "Yes";
	}
	//------------------------------------------------------------
	//	Путь к собственному исполняемому файлу
	//------------------------------------------------------------
	fs::path selfExePath() {
		return platform::selfExePath();
	}
	//------------------------------------------------------------
	//	Фабрики коллабораторов для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IConsentPrompt> makeConsentPrompt() {
		return std::make_unique<NativeDialogPrompt>();
	}

	std::unique_ptr<ITerminalHost> makeTerminalHost() {
		return std::make_unique<VisibleTerminalHost>();
	}

	ScriptFlavor nativeScriptFlavor() {
		return platform::scriptFlavor();
	}
}; //---namespace bklaunch
