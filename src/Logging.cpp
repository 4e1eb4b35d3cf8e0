#include "backend_launcher/Logging.hpp"
#include <glog/logging.h>

namespace bklaunch {

	//---Инициализация логгера
	void initLogging(const char* programName, const LaunchConfig& cfg)
	{
		//---Файлы glog не создаются: журнал запуска ведёт FileLaunchLog
		FLAGS_logtostderr = true;
		FLAGS_colorlogtostderr = true;
		FLAGS_minloglevel = cfg.verbose ? google::GLOG_INFO : google::GLOG_WARNING;

		google::InitGoogleLogging(programName); // Инициализация
	}

};//---namespace bklaunch
