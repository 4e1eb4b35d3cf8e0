// tests/test_install_orchestrator.cpp
//
// Установка зависимостей: согласие пользователя, фильтрация манифеста,
// запуск скрипта в терминале и очистка временных файлов.

#include <doctest/doctest.h>

#include "backend_launcher/InstallOrchestrator.hpp"
#include "support/TestSupport.hpp"

using namespace bklaunch;
using namespace bklaunch::test;

namespace {

struct Fixture {
    TempDir dir;
    LaunchConfig cfg;
    MemoryLaunchLog log;

    fs::path backend() const { return dir.path() / "backend"; }
    fs::path script() const { return backend() / "install_deps.sh"; }
    fs::path filtered() const { return backend() / "requirements_install.txt"; }

    Fixture() { fs::create_directories(backend()); }
};

} // namespace

TEST_CASE("isAffirmative accepts only a literal Yes")
{
    CHECK(isAffirmative("Yes"));
    CHECK(isAffirmative("  Yes\r\n"));
    CHECK_FALSE(isAffirmative("No\n"));
    CHECK_FALSE(isAffirmative("yes"));
    CHECK_FALSE(isAffirmative("Yes, please"));
    CHECK_FALSE(isAffirmative(""));
}

TEST_CASE("decide never prompts unless dependencies are missing")
{
    Fixture f;
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.decide(ProbeResult::Ok) == InstallDecision::NotNeeded);
    CHECK(orch.decide(ProbeResult::Indeterminate) == InstallDecision::NotNeeded);
    CHECK(orch.run(ProbeResult::Ok, f.backend()) == InstallOutcome::NotAttempted);
    CHECK(prompt.calls == 0);
    CHECK(terminal.commands.empty());
}

TEST_CASE("decide asks with the configured title and message")
{
    Fixture f;
    ScriptedPrompt prompt(ConsentAnswer::No);
    RecordingTerminal terminal;
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.decide(ProbeResult::Missing) == InstallDecision::UserDeclined);
    CHECK(prompt.calls == 1);
    CHECK(prompt.lastTitle == "Missing Dependencies");
    CHECK(prompt.lastMessage.find("PyTorch") != std::string::npos);
}

TEST_CASE("declined installation writes no files and runs nothing")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "fastapi\ntorch\n");
    ScriptedPrompt prompt(ConsentAnswer::No);
    RecordingTerminal terminal;
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::NotAttempted);
    CHECK(terminal.commands.empty());
    CHECK_FALSE(fs::exists(f.script()));
    CHECK_FALSE(fs::exists(f.filtered()));
    CHECK(f.log.contains("User declined installation"));
    CHECK(f.log.contains("Install decision: user declined"));
}

TEST_CASE("a dialog failure skips installation without aborting")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "fastapi\n");
    ScriptedPrompt prompt(ConsentAnswer::Failed);
    RecordingTerminal terminal;
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.decide(ProbeResult::Missing) == InstallDecision::PromptFailed);
    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::NotAttempted);
    CHECK(terminal.commands.empty());
    CHECK(f.log.contains("Failed to show dialog: dialog host unavailable"));
}

TEST_CASE("approved installation runs the script on the filtered manifest and cleans up")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "torch==2.0\nfastapi\nTORCH-vision\n");
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(0);

    //---Во время установки оба временных файла существуют
    bool scriptExisted = false;
    std::string filteredDuringRun;
    terminal.onRun = [&](const CommandSpec&) {
        scriptExisted = fs::exists(f.script());
        filteredDuringRun = readFile(f.filtered());
    };

    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);
    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::Succeeded);

    REQUIRE(terminal.commands.size() == 1);
    const CommandSpec& cmd = terminal.commands[0];
    CHECK(cmd.program == fs::path("/bin/sh"));
    REQUIRE(cmd.args.size() == 1);
    CHECK(cmd.args[0] == f.script().string());
    CHECK(cmd.workingDir == f.backend());

    CHECK(scriptExisted);
    CHECK(filteredDuringRun == "fastapi\nTORCH-vision\n");
    CHECK(terminal.scriptContent.find("install -r '" + f.filtered().string() + "'") != std::string::npos);

    CHECK_FALSE(fs::exists(f.script()));
    CHECK_FALSE(fs::exists(f.filtered()));
    CHECK(fs::exists(f.backend() / "requirements.txt"));
    CHECK(f.log.contains("Installer finished successfully."));
}

TEST_CASE("a failing installer session is reported as Failed and still cleaned up")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "fastapi\n");
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(1);
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::Failed);
    CHECK(f.log.contains("Installer exited with code 1"));
    CHECK_FALSE(fs::exists(f.script()));
    CHECK_FALSE(fs::exists(f.filtered()));
}

TEST_CASE("a terminal that cannot start yields ScriptFailed and cleanup")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "fastapi\n");
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(0, false);
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::ScriptFailed);
    CHECK(f.log.contains("Failed to run installer script: terminal not available"));
    CHECK_FALSE(fs::exists(f.script()));
    CHECK_FALSE(fs::exists(f.filtered()));
}

TEST_CASE("a missing manifest skips installation after consent")
{
    Fixture f;
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal;
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Posix);

    CHECK(orch.run(ProbeResult::Missing, f.backend()) == InstallOutcome::ManifestMissing);
    CHECK(prompt.calls == 1);
    CHECK(terminal.commands.empty());
    CHECK(f.log.contains("requirements.txt not found"));
}

TEST_CASE("batch flavor writes install_deps.bat and runs it through cmd")
{
    Fixture f;
    writeFile(f.backend() / "requirements.txt", "fastapi\n");
    ScriptedPrompt prompt(ConsentAnswer::Yes);
    RecordingTerminal terminal(0);
    InstallOrchestrator orch(f.cfg, prompt, terminal, f.log, ScriptFlavor::Batch);

    CHECK(orch.install(f.backend()) == InstallOutcome::Succeeded);
    REQUIRE(terminal.commands.size() == 1);
    CHECK(terminal.commands[0].program == fs::path("cmd"));
    CHECK(terminal.scriptContent.find("@echo off") == 0);
    CHECK_FALSE(fs::exists(f.backend() / "install_deps.bat"));
}
