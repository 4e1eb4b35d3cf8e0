#pragma once
#include <string>
#include <string_view>

namespace bklaunch {

	//---Ответ пользователя
	enum class ConsentAnswer {
		Yes,
		No,
		Failed			//	Диалог не удалось показать
	};

	//---Интерфейс вопроса да/нет (модальный диалог ОС; в тестах - сценарий)
	class IConsentPrompt {
	public:
		virtual ~IConsentPrompt() = default;

		//---Блокирует до ответа пользователя
		virtual ConsentAnswer ask(const std::string& title, const std::string& message, std::string* error) = 0;
	};

	//---Ответ диалога утвердительный только для буквального "Yes" (без учёта пробелов по краям)
	bool isAffirmative(std::string_view dialogOutput);

};//---namespace bklaunch
