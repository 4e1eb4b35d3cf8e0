#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Настройки лаунчера
	//   Все аргументы командной строки принадлежат запускаемому бэкенду,
	//   поэтому переопределение настроек возможно только через переменные окружения.
	struct LaunchConfig final {

		//---Интерпретатор и модуль бэкенда
		std::string interpreter = "python";			//	Имя ищется в PATH; относительный путь - от каталога запуска лаунчера
		std::string module = "backend.main";		//	Запуск: <interpreter> -m <module> [args...]

		//---Раскладка каталогов установки
		std::string backendDirName = "backend";
		std::string resourcesDirName = "resources";

		//---Проверка зависимостей
		std::vector<std::string> requiredModules = {
			"fastapi", "uvicorn", "sqlalchemy", "alembic", "python_multipart", "numpy"
		};

		//---Установка зависимостей
		std::string packageManager = "pip";
		std::string manifestName = "requirements.txt";
		std::string filteredManifestName = "requirements_install.txt";
		std::vector<std::string> protectedPackages = { "torch" };	//	Не переустанавливаются автоматически

		//---Диалог согласия пользователя
		std::string dialogTitle = "Missing Dependencies";
		std::string dialogMessage =
			"The backend requires Python dependencies (FastAPI, SQLAlchemy, etc.) that are missing "
			"in your global environment.\n\n"
			"Do you want to install them now using pip?\n"
			"(This will try to protect your existing PyTorch installation)";

		//---Ожидание закрытия каналов вывода после завершения бэкенда (их могут
		//   унаследовать фоновые процессы бэкенда)
		int outputGraceMs = 2000;

		fs::path logPath;				//	Журнал запуска (по умолчанию <temp>/backend-launch.log)
		bool verbose = false;			//	Диагностика glog уровня INFO
	};

	//---Источник переменных окружения (подменяется в тестах)
	using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

	//---Переменные окружения текущего процесса
	EnvLookup systemEnv();

	//---Путь к журналу запуска по умолчанию
	fs::path defaultLogPath();

	//---Настройки по умолчанию с учётом переопределений из окружения
	LaunchConfig loadConfig(const EnvLookup& env);

	//---Текстовое описание настроек для журнала (по строке на параметр)
	std::vector<std::string> describeConfig(const LaunchConfig& cfg);

};//---namespace bklaunch
