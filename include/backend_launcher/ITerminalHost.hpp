#pragma once
#include <string>
#include "backend_launcher/CommandSpec.hpp"

namespace bklaunch {

	//---Интерфейс видимого терминала: команда выполняется так, чтобы пользователь
	//   видел ход выполнения, вызов блокируется до её завершения
	class ITerminalHost {
	public:
		virtual ~ITerminalHost() = default;

		//---false - команду не удалось запустить; exitCode - код завершения сеанса
		virtual bool runVisible(const CommandSpec& cmd, int* exitCode, std::string* error) = 0;
	};

};//---namespace bklaunch
