#include "backend_launcher/LaunchLog.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <glog/logging.h>

namespace bklaunch {

	//------------------------------------------------------------
	//	Метка времени в локальном времени
	//------------------------------------------------------------
	std::string LaunchLog::timestamp()
	{
		const std::time_t now = std::time(nullptr);
		std::tm tm{};
#ifdef _WIN32
		localtime_s(&tm, &now);
#else
		localtime_r(&now, &tm);
#endif
		std::ostringstream os;
		os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
		return os.str();
	}

	void LaunchLog::info(const std::string& msg)
	{
		write("[" + timestamp() + "] " + msg);
	}

	void LaunchLog::warning(const std::string& msg)
	{
		LOG(WARNING) << msg;
		write("[" + timestamp() + "] " + msg);
	}

	void LaunchLog::error(const std::string& msg)
	{
		LOG(ERROR) << msg;
		write("[" + timestamp() + "] " + msg);
	}

	//------------------------------------------------------------
	//	Открытие файла журнала (усечение при каждом запуске лаунчера)
	//------------------------------------------------------------
	bool FileLaunchLog::open(const fs::path& path, std::string* error)
	{
		std::lock_guard<std::mutex> lock(mtx_);

		path_ = path;

		//---Каталог журнала (обычно временный каталог уже существует)
		std::error_code ec;
		if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
		//---если ec != 0 - не фатально, попробуем открыть

		if (file_.is_open()) file_.close();
		file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
		if (!file_)
		{
			if (error) *error = "Failed to open launch log for writing: " + path.string();
			return false;
		}
		return true;
	}

	//------------------------------------------------------------
	//	Запись строки: одна строка целиком под мьютексом
	//------------------------------------------------------------
	void FileLaunchLog::write(const std::string& line)
	{
		std::lock_guard<std::mutex> lock(mtx_);

		//---Журнал best-effort: если файл не открыт, запись пропускается
		if (!file_.is_open()) return;

		file_ << line << '\n';
		file_.flush();
	}

};//---namespace bklaunch
