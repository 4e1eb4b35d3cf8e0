#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Манифест зависимостей для одной попытки установки.
	//   filteredPath - временный файл, удаляется после установки.
	struct DependencyManifest final {
		fs::path sourcePath;
		std::vector<std::string> filteredEntries;
		fs::path filteredPath;
	};

	//---Строка защищённого пакета: обрезанный текст начинается с маркера (с учётом регистра)
	bool isProtectedEntry(std::string_view line, const std::vector<std::string>& markers);

	//---Строки манифеста без защищённых пакетов (порядок сохраняется, '\r' в конце отбрасывается)
	std::vector<std::string> filterManifestLines(std::string_view content, const std::vector<std::string>& markers);

	//---Чтение исходного манифеста, фильтрация и запись filteredPath
	bool writeFilteredManifest(DependencyManifest& manifest, const std::vector<std::string>& markers, std::string* error);

};//---namespace bklaunch
