#if defined(__linux__)
#include "platform/PlatformImpl.hpp"
#include "backend_launcher/InstallScript.hpp"
#include "backend_launcher/Strings.hpp"

#include <cstdlib>
#include <unistd.h>
#include <vector>

namespace bklaunch::platform {

	namespace {

		//---Диалог: zenity, при его отсутствии - вопрос в терминале (если stdin - терминал).
		//   $1 - заголовок, $2 - текст. Вопрос в терминале пишется в stderr: stdout читает лаунчер.
		constexpr const char* kDialogScript =
			"if command -v zenity >/dev/null 2>&1; then\n"
			"  zenity --question --no-wrap --title=\"$1\" --text=\"$2\" 2>/dev/null\n"
			"  rc=$?\n"
			"  case $rc in\n"
			"    0) echo Yes ;;\n"
			"    1) echo No ;;\n"
			"    *) exit $rc ;;\n"
			"  esac\n"
			"  exit 0\n"
			"fi\n"
			"if [ -t 0 ]; then\n"
			"  printf '%s\\n\\n%s\\n[y/N] ' \"$1\" \"$2\" >&2\n"
			"  read -r answer || exit 1\n"
			"  case $answer in\n"
			"    [Yy]*) echo Yes ;;\n"
			"    *) echo No ;;\n"
			"  esac\n"
			"  exit 0\n"
			"fi\n"
			"exit 127\n";

		//---Поиск исполняемого файла в PATH
		bool findInPath(const std::string& name, fs::path& out)
		{
			const char* path = std::getenv("PATH");
			if (!path) return false;

			for (const auto& dir : splitList(path, ':'))
			{
				const fs::path candidate = fs::path(dir) / name;
				if (::access(candidate.c_str(), X_OK) == 0)
				{
					out = candidate;
					return true;
				}
			}
			return false;
		}

	} // namespace

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
	}

	CommandSpec dialogCommand(const std::string& title, const std::string& message)
	{
		CommandSpec cmd;
		cmd.program = "/bin/sh";
		cmd.args = { "-c", kDialogScript, "sh", title, message };
		return cmd;
	}

	//---Текущий терминал, если stdin - терминал; иначе x-terminal-emulator (если есть);
	//   иначе обычный блокирующий запуск с выводом в stdout/stderr лаунчера
	CommandSpec visibleCommand(const CommandSpec& inner)
	{
		if (::isatty(STDIN_FILENO)) return inner;

		fs::path term;
		if (!findInPath("x-terminal-emulator", term)) return inner;

		CommandSpec cmd;
		cmd.program = term;
		cmd.workingDir = inner.workingDir;
		cmd.args.push_back("-e");
		cmd.args.push_back(inner.program.string());
		cmd.args.insert(cmd.args.end(), inner.args.begin(), inner.args.end());
		return cmd;
	}

	ScriptFlavor scriptFlavor()
	{
		return ScriptFlavor::Posix;
	}

} // namespace bklaunch::platform
#endif
