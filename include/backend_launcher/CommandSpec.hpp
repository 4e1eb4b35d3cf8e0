#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Описание команды для запуска (данные, без исполнения)
	struct CommandSpec final {
		fs::path program;					//	Исполняемый файл (имя без каталога ищется в PATH)
		std::vector<std::string> args;		//	Аргументы без argv[0]
		fs::path workingDir;				//	Рабочий каталог (опционально)
	};

};//---namespace bklaunch
