#pragma once
#include <string>
#include <vector>

#include "backend_launcher/Config.hpp"

namespace bklaunch {

	class LaunchLog;

	//---Результат проверки зависимостей
	enum class ProbeResult {
		Ok,				//	Проверка выполнена, все пакеты импортируются
		Missing,		//	Проверка выполнена и завершилась ошибкой
		Indeterminate	//	Проверку не удалось запустить (нет интерпретатора)
	};

	const char* toString(ProbeResult r);

	//---Скрипт проверки: импорт пакетов, выход с кодом 1 при ImportError
	std::string buildProbeScript(const std::vector<std::string>& modules);

	//---Запуск "<interpreter> -c <script>" (только чтение, вывод не пересылается).
	//   Блокирует до завершения проверки.
	ProbeResult probeDependencies(const LaunchConfig& cfg, LaunchLog& log);

};//---namespace bklaunch
