#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace bklaunch {

	namespace fs = std::filesystem;

	//---Журнал запуска: плоский текстовый журнал, только дозапись.
	//   Каждая запись - одна строка "[YYYY-MM-DD HH:MM:SS] сообщение".
	//   Пишется из управляющего потока и из обоих потоков чтения вывода процесса.
	class LaunchLog {
	public:
		virtual ~LaunchLog() = default;

		//---Обычное сообщение
		void info(const std::string& msg);
		//---Предупреждение (дублируется в glog WARNING)
		void warning(const std::string& msg);
		//---Ошибка (дублируется в glog ERROR)
		void error(const std::string& msg);

		//---Метка времени в формате журнала (локальное время)
		static std::string timestamp();

	protected:
		//---Запись одной готовой строки (без перевода строки); должна быть потокобезопасной
		virtual void write(const std::string& line) = 0;
	};

	//---Журнал в файле. Файл усекается при открытии и остаётся открытым на дозапись.
	class FileLaunchLog final : public LaunchLog {
	public:
		FileLaunchLog() = default;
		FileLaunchLog(const FileLaunchLog&) = delete;
		FileLaunchLog& operator=(const FileLaunchLog&) = delete;

		//---Открытие с усечением прежнего содержимого
		bool open(const fs::path& path, std::string* error);

		const fs::path& path() const { return path_; }

	protected:
		void write(const std::string& line) override;

	private:
		std::mutex mtx_;
		std::ofstream file_;
		fs::path path_;
	};

};//---namespace bklaunch
