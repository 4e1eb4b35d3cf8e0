#include "backend_launcher/InstallScript.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace bklaunch {

	std::string installerScriptName(ScriptFlavor flavor)
	{
		return flavor == ScriptFlavor::Batch ? "install_deps.bat" : "install_deps.sh";
	}

	//---'...' с заменой ' на '\''
	std::string shellQuote(std::string_view s)
	{
		std::string out;
		out.reserve(s.size() + 2);
		out.push_back('\'');
		for (char c : s)
		{
			if (c == '\'') out += "'\\''";
			else out.push_back(c);
		}
		out.push_back('\'');
		return out;
	}

	namespace {

		std::string posixScript(const std::string& target, const std::string& packageManager)
		{
			std::ostringstream os;
			os <<
				"#!/bin/sh\n"
				"echo 'Installing missing Python dependencies...'\n"
				"echo Target: " << shellQuote(target) << "\n" <<
				packageManager << " install -r " << shellQuote(target) << "\n"
				"status=$?\n"
				"if [ $status -ne 0 ]; then\n"
				"    echo\n"
				"    echo 'Installation FAILED. Please check the error messages above.'\n"
				"    printf 'Press Enter to continue...'\n"
				"    read -r _ignored\n"
				"    exit $status\n"
				"fi\n"
				"echo\n"
				"echo 'Installation successful!'\n"
				"sleep 5\n";
			return os.str();
		}

		std::string batchScript(const std::string& target, const std::string& packageManager)
		{
			std::ostringstream os;
			os <<
				"@echo off\r\n"
				"title Dependency Installer\r\n"
				"echo Installing missing Python dependencies...\r\n"
				"echo Target: " << target << "\r\n" <<
				packageManager << " install -r \"" << target << "\"\r\n"
				"if %errorlevel% neq 0 (\r\n"
				"    echo.\r\n"
				"    echo Installation FAILED. Please check the error messages above.\r\n"
				"    pause\r\n"
				"    exit /b %errorlevel%\r\n"
				")\r\n"
				"echo.\r\n"
				"echo Installation successful!\r\n"
				"timeout /t 5\r\n";
			return os.str();
		}

	} // namespace

	InstallerScript makeInstallerScript(const fs::path& dir, const fs::path& manifest,
		const std::string& packageManager, ScriptFlavor flavor)
	{
		InstallerScript s;
		s.flavor = flavor;
		s.path = dir / installerScriptName(flavor);
		s.content = flavor == ScriptFlavor::Batch
			? batchScript(manifest.string(), packageManager)
			: posixScript(manifest.string(), packageManager);
		return s;
	}

	bool writeInstallerScript(const InstallerScript& script, std::string* error)
	{
		{
			std::ofstream f(script.path, std::ios::binary | std::ios::trunc);
			if (!f)
			{
				if (error) *error = "Failed to open installer script for writing: " + script.path.string();
				return false;
			}
			f << script.content;
			f.flush();
			if (!f)
			{
				if (error) *error = "Failed to write installer script: " + script.path.string();
				return false;
			}
		}

		if (script.flavor == ScriptFlavor::Posix)
		{
			std::error_code ec;
			fs::permissions(script.path,
				fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec,
				fs::perm_options::replace, ec);
			//---Скрипт запускается через /bin/sh, право на выполнение не обязательно
		}
		return true;
	}

	CommandSpec scriptCommand(const InstallerScript& script)
	{
		CommandSpec cmd;
		cmd.workingDir = script.path.parent_path();
		if (script.flavor == ScriptFlavor::Batch)
		{
			cmd.program = "cmd";
			cmd.args = { "/c", script.path.string() };
		}
		else
		{
			cmd.program = "/bin/sh";
			cmd.args = { script.path.string() };
		}
		return cmd;
	}

};//---namespace bklaunch
