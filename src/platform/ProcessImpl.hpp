#pragma once
#include "backend_launcher/Process.hpp"

namespace bklaunch::process::detail {

// Дескрипторы только что запущенного процесса
struct SpawnedHandles final {
    std::int64_t pid = 0;
    NativeHandle process = kInvalidHandle;  // Linux: pid, Windows: HANDLE процесса
    NativeHandle out = kInvalidHandle;      // Читающий конец канала stdout (Stdio::Capture)
    NativeHandle err = kInvalidHandle;      // Читающий конец канала stderr (Stdio::Capture)
};

// Платформенно-специфичная реализация (ProcessWin.cpp / ProcessLinux.cpp)
//   spawnPlatform - запуск процесса; false, если процесс не запущен (sysError заполнен)
//   waitPlatform - блокирующее ожидание завершения, заполняет exited/exitCode/termSignal
//   readPipePlatform - >0 прочитано байт, 0 конец ввода, <0 ошибка (sysError заполнен)
//   waitReadablePlatform - >0 есть данные или конец ввода, 0 таймаут, <0 ошибка
bool spawnPlatform(const fs::path& exe, const std::vector<std::string>& args,
    const RunOptions& opt, SpawnedHandles& h, std::uint32_t& sysError);

bool waitPlatform(NativeHandle process, RunResult& out);

long long readPipePlatform(NativeHandle h, char* buf, std::size_t size, std::uint32_t& sysError);

int waitReadablePlatform(NativeHandle h, int timeoutMs, std::uint32_t& sysError);

void closePipePlatform(NativeHandle h);

// Освобождение дескриптора процесса (Windows: CloseHandle, Linux: ничего)
void releaseProcessPlatform(NativeHandle process);

} // namespace bklaunch::process::detail
