#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include "backend_launcher/InstallScript.hpp"
#include <windows.h>

namespace bklaunch::platform {

	namespace {

		//---Строка PowerShell в одинарных кавычках: ' удваивается, перевод строки - [char]10
		std::string psLiteral(const std::string& s)
		{
			std::string out = "'";
			for (char c : s)
			{
				if (c == '\'') out += "''";
				else if (c == '\n') out += "' + [char]10 + '";
				else if (c != '\r') out.push_back(c);
			}
			out += "'";
			return out;
		}

	} // namespace

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		wchar_t buf[MAX_PATH]{};
		DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
		if (n == 0 || n >= MAX_PATH) return {};
		return fs::path(buf);
	}

	//---MessageBox через PowerShell: печатает Yes / No
	CommandSpec dialogCommand(const std::string& title, const std::string& message)
	{
		CommandSpec cmd;
		cmd.program = "powershell";
		cmd.args = {
			"-NoProfile", "-Command",
			"Add-Type -AssemblyName System.Windows.Forms\n"
			"$result = [System.Windows.Forms.MessageBox]::Show(" + psLiteral(message) + ", " + psLiteral(title) +
			", 'YesNo', 'Question')\n"
			"Write-Output $result\n"
		};
		return cmd;
	}

	//---cmd /C start "" /wait <команда>: отдельное окно консоли, ожидание его закрытия
	CommandSpec visibleCommand(const CommandSpec& inner)
	{
		CommandSpec cmd;
		cmd.program = "cmd";
		cmd.workingDir = inner.workingDir;
		cmd.args = { "/C", "start", "", "/wait", inner.program.string() };
		cmd.args.insert(cmd.args.end(), inner.args.begin(), inner.args.end());
		return cmd;
	}

	ScriptFlavor scriptFlavor()
	{
		return ScriptFlavor::Batch;
	}

} // namespace bklaunch::platform
#endif
