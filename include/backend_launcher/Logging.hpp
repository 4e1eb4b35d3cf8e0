#pragma once
#include "backend_launcher/Config.hpp"

namespace bklaunch {

	//---Инициализация glog: диагностика лаунчера только в stderr
	//   (уровень WARNING, или INFO при cfg.verbose)
	void initLogging(const char* programName, const LaunchConfig& cfg);

};//---namespace bklaunch
