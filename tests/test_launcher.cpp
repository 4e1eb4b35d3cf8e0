// tests/test_launcher.cpp
//
// Полный сценарий запуска с подменой интерпретатора, диалога и терминала.

#include <doctest/doctest.h>

#include "backend_launcher/Launcher.hpp"
#include "support/TestSupport.hpp"

#include <sstream>

#if !defined(_WIN32)

using namespace bklaunch;
using namespace bklaunch::test;

namespace {

//---Установка: <root>/bin/backend-launcher, <root>/bin/resources/backend
struct Install {
    TempDir dir;
    LaunchConfig cfg;
    MemoryLaunchLog log;
    std::ostringstream out;
    std::ostringstream err;
    LaunchContext ctx;

    fs::path bin() const { return dir.path() / "bin"; }
    fs::path backend() const { return bin() / "resources" / "backend"; }
    fs::path marker(const char* name) const { return dir.path() / name; }

    Install()
    {
        fs::create_directories(bin());
        ctx.executableLocation = bin() / "backend-launcher";
        ctx.executableDirectory = bin();
        cfg.logPath = dir.path() / "launch.log";
    }

    //---Интерпретатор: "-c" - проверка зависимостей с кодом из файла probe_exit,
    //   иначе запуск бэкенда с выводом рабочего каталога и аргументов
    void interpreter(int probeExit, int backendExit)
    {
        writeFile(marker("probe_exit"), std::to_string(probeExit));
        cfg.interpreter = writeExecutable(dir.path() / "python",
            "if [ \"$1\" = \"-c\" ]; then exit $(cat \"" + marker("probe_exit").string() + "\"); fi\n"
            "touch \"" + marker("launched").string() + "\"\n"
            "shift 2\n"
            "echo \"cwd:$(pwd -P)\"\n"
            "for a in \"$@\"; do echo \"arg:$a\"; done\n"
            "exit " + std::to_string(backendExit) + "\n").string();
    }

    int launch(IConsentPrompt& prompt, ITerminalHost& terminal)
    {
        LauncherServices svc{ log, prompt, terminal, out, err, ScriptFlavor::Posix };
        return runLauncher(ctx, cfg, svc);
    }
};

} // namespace

TEST_CASE("a missing backend directory exits with 1 before anything is spawned")
{
    Install in;
    in.interpreter(0, 0);
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;

    CHECK(in.launch(prompt, terminal) == 1);
    CHECK_FALSE(fs::exists(in.marker("launched")));
    CHECK(prompt.calls == 0);
    CHECK(terminal.commands.empty());
    CHECK(in.log.count("(not found)") == 4);
    CHECK_FALSE(in.log.contains("pre-flight dependency check"));
}

TEST_CASE("satisfied dependencies launch the backend from the parent of the backend directory")
{
    Install in;
    fs::create_directories(in.backend());
    in.interpreter(0, 0);
    in.ctx.forwardedArgs = { "--port", "8000" };
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;

    CHECK(in.launch(prompt, terminal) == 0);
    CHECK(prompt.calls == 0);
    CHECK(terminal.commands.empty());
    CHECK(fs::exists(in.marker("launched")));

    CHECK(in.out.str() ==
        "cwd:" + fs::canonical(in.bin() / "resources").string() + "\n"
        "arg:--port\n"
        "arg:8000\n");

    //---Этапы в журнале идут в порядке выполнения
    const long started = in.log.indexOf("Starting backend wrapper");
    const long found = in.log.indexOf("Found backend at");
    const long ok = in.log.indexOf("Dependencies look OK.");
    const long exited = in.log.indexOf("Process exited with code 0");
    CHECK(started >= 0);
    CHECK(started < found);
    CHECK(found < ok);
    CHECK(ok < exited);
}

TEST_CASE("the launcher exit code mirrors the backend")
{
    Install in;
    fs::create_directories(in.backend());
    in.interpreter(0, 3);
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;

    CHECK(in.launch(prompt, terminal) == 3);
}

TEST_CASE("declining the installation still launches the backend")
{
    Install in;
    fs::create_directories(in.backend());
    writeFile(in.backend() / "requirements.txt", "fastapi\ntorch\n");
    in.interpreter(1, 0);
    ScriptedPrompt prompt(ConsentAnswer::No);
    RecordingTerminal terminal;

    CHECK(in.launch(prompt, terminal) == 0);
    CHECK(prompt.calls == 1);
    CHECK(terminal.commands.empty());
    CHECK(fs::exists(in.marker("launched")));
    CHECK_FALSE(fs::exists(in.backend() / "install_deps.sh"));
    CHECK_FALSE(fs::exists(in.backend() / "requirements_install.txt"));
}

TEST_CASE("approving the installation runs the installer once and then launches without re-probing")
{
    Install in;
    fs::create_directories(in.backend());
    writeFile(in.backend() / "requirements.txt", "torch==2.0\nfastapi\n");
    in.interpreter(1, 0);
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(0);

    CHECK(in.launch(prompt, terminal) == 0);
    REQUIRE(terminal.commands.size() == 1);
    CHECK(terminal.commands[0].workingDir == in.backend());
    CHECK(terminal.scriptContent.find("requirements_install.txt") != std::string::npos);

    CHECK(fs::exists(in.marker("launched")));
    CHECK(in.log.count("pre-flight dependency check") == 1);
    CHECK(in.log.contains("Dependency installation succeeded."));
    CHECK(in.log.indexOf("Dependency installation succeeded.") < in.log.indexOf("Process exited with code 0"));
    CHECK_FALSE(fs::exists(in.backend() / "install_deps.sh"));
    CHECK_FALSE(fs::exists(in.backend() / "requirements_install.txt"));
}

TEST_CASE("a failed installation does not prevent the launch")
{
    Install in;
    fs::create_directories(in.backend());
    writeFile(in.backend() / "requirements.txt", "fastapi\n");
    in.interpreter(1, 0);
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(2);

    CHECK(in.launch(prompt, terminal) == 0);
    CHECK(in.log.contains("Dependency installation failed."));
    CHECK(fs::exists(in.marker("launched")));
}

TEST_CASE("a missing interpreter skips the prompt and fails the launch with 1")
{
    Install in;
    fs::create_directories(in.backend());
    in.cfg.interpreter = "backend-launcher-no-such-python";
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;

    CHECK(in.launch(prompt, terminal) == 1);
    CHECK(prompt.calls == 0);
    CHECK(in.log.contains("Is python installed?"));
    CHECK(in.log.contains("is in your system PATH."));
}

#endif
