// tests/test_install_script.cpp
//
// Скрипт установки зависимостей: содержимое, экранирование, команда запуска.

#include <doctest/doctest.h>

#include "backend_launcher/InstallScript.hpp"
#include "backend_launcher/Process.hpp"
#include "support/TestSupport.hpp"

using namespace bklaunch;
using namespace bklaunch::test;

TEST_CASE("installerScriptName depends on the script flavor")
{
    CHECK(installerScriptName(ScriptFlavor::Posix) == "install_deps.sh");
    CHECK(installerScriptName(ScriptFlavor::Batch) == "install_deps.bat");
}

TEST_CASE("shellQuote wraps in single quotes and escapes embedded quotes")
{
    CHECK(shellQuote("") == "''");
    CHECK(shellQuote("/opt/my app/req.txt") == "'/opt/my app/req.txt'");
    CHECK(shellQuote("it's") == "'it'\\''s'");
}

TEST_CASE("posix installer script installs from the filtered manifest")
{
    const auto s = makeInstallerScript("/opt/app/resources/backend",
        "/opt/app/resources/backend/requirements_install.txt", "pip", ScriptFlavor::Posix);

    CHECK(s.path == fs::path("/opt/app/resources/backend/install_deps.sh"));
    CHECK(s.content.rfind("#!/bin/sh\n", 0) == 0);
    CHECK(s.content.find("echo Target: '/opt/app/resources/backend/requirements_install.txt'") != std::string::npos);
    CHECK(s.content.find("pip install -r '/opt/app/resources/backend/requirements_install.txt'") != std::string::npos);
    CHECK(s.content.find("Installation FAILED") != std::string::npos);
    CHECK(s.content.find("exit $status") != std::string::npos);
    CHECK(s.content.find("Installation successful!") != std::string::npos);
    CHECK(s.content.find("sleep 5") != std::string::npos);
}

TEST_CASE("batch installer script pauses on failure and propagates errorlevel")
{
    const auto s = makeInstallerScript("C:\\App\\backend", "C:\\App\\backend\\requirements_install.txt",
        "pip", ScriptFlavor::Batch);

    CHECK(s.path.filename() == "install_deps.bat");
    CHECK(s.content.rfind("@echo off\r\n", 0) == 0);
    CHECK(s.content.find("pip install -r \"C:\\App\\backend\\requirements_install.txt\"") != std::string::npos);
    CHECK(s.content.find("pause") != std::string::npos);
    CHECK(s.content.find("exit /b %errorlevel%") != std::string::npos);
    CHECK(s.content.find("timeout /t 5") != std::string::npos);
}

TEST_CASE("scriptCommand runs the script from its own directory")
{
    InstallerScript posix;
    posix.path = "/opt/app/backend/install_deps.sh";
    posix.flavor = ScriptFlavor::Posix;

    const auto c = scriptCommand(posix);
    CHECK(c.program == fs::path("/bin/sh"));
    REQUIRE(c.args.size() == 1);
    CHECK(c.args[0] == "/opt/app/backend/install_deps.sh");
    CHECK(c.workingDir == fs::path("/opt/app/backend"));

    InstallerScript batch;
    batch.path = "C:/App/backend/install_deps.bat";
    batch.flavor = ScriptFlavor::Batch;

    const auto b = scriptCommand(batch);
    CHECK(b.program == fs::path("cmd"));
    REQUIRE(b.args.size() == 2);
    CHECK(b.args[0] == "/c");
}

#if !defined(_WIN32)
TEST_CASE("posix installer script exits with the package manager status on failure")
{
    TempDir dir;
    const fs::path manifest = dir.path() / "requirements_install.txt";
    writeFile(manifest, "fastapi\n");

    //---Подмена pip: запоминает аргументы и завершается с ошибкой
    const fs::path fakePip = writeExecutable(dir.path() / "fake-pip",
        "echo \"$@\" > \"" + (dir.path() / "pip_args").string() + "\"\nexit 3\n");

    const auto script = makeInstallerScript(dir.path(), manifest, fakePip.string(), ScriptFlavor::Posix);
    std::string err;
    REQUIRE(writeInstallerScript(script, &err));

    //---stdin из /dev/null: ожидание подтверждения сразу получает конец ввода
    process::RunResult r;
    process::RunOptions opt;
    opt.stdoutMode = process::Stdio::Capture;
    opt.stderrMode = process::Stdio::Null;
    REQUIRE(process::run("/bin/sh", { "-c", "/bin/sh " + shellQuote(script.path.string()) + " < /dev/null" }, r, opt));

    CHECK(r.exited);
    CHECK(r.exitCode == 3);
    CHECK(r.output.find("Installation FAILED") != std::string::npos);
    CHECK(r.output.find("Installation successful!") == std::string::npos);
    CHECK(readFile(dir.path() / "pip_args") == "install -r " + manifest.string() + "\n");
}
#endif
