#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Контекст запуска, создаётся один раз при старте лаунчера
	struct LaunchContext final {

		fs::path executableLocation;		//	Путь к собственному исполняемому файлу (может быть пустым)
		fs::path executableDirectory;		//	Каталог лаунчера

		std::vector<fs::path> candidateBackendPaths;	//	Кандидаты в порядке приоритета
		std::optional<fs::path> resolvedBackendPath;	//	Задаётся один раз (PathResolver)
		fs::path workingDirectory;						//	Родитель каталога бэкенда

		std::vector<std::string> forwardedArgs;		//	Аргументы лаунчера без argv[0], без изменений
	};

};//---namespace bklaunch
