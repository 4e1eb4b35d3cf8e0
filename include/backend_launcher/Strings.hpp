#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace bklaunch {

	//---Пробельный символ (ASCII)
	constexpr bool isSpace(char c) noexcept
	{
		return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
	}

	//---Обрезка пробельных символов в начале и конце строки
	constexpr std::string_view trimView(std::string_view sv) noexcept
	{
		while (!sv.empty() && isSpace(sv.front())) sv.remove_prefix(1);
		while (!sv.empty() && isSpace(sv.back())) sv.remove_suffix(1);
		return sv;
	}

	//---Удаление кавычек в начале и конце строки (если они есть)
	constexpr std::string_view trimQuotesView(std::string_view sv) noexcept
	{
		//---Проверка длины строки
		if (sv.size() < 2) return sv;

		//---Проверка на двойные или одинарные кавычки
		const bool doubleQuoted = (sv.front() == '"' && sv.back() == '"');
		const bool singleQuoted = (sv.front() == '\'' && sv.back() == '\'');

		if (doubleQuoted || singleQuoted) {
			sv.remove_prefix(1);
			sv.remove_suffix(1);
		}
		return sv;
	}

	//---Проверка, что строка начинается с префикса (с учётом регистра)
	constexpr bool startsWith(std::string_view s, std::string_view p) noexcept
	{
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}

	//---Разбиение списка через запятую; пустые элементы отбрасываются
	inline std::vector<std::string> splitList(std::string_view s, char sep = ',')
	{
		std::vector<std::string> out;
		while (!s.empty())
		{
			const auto pos = s.find(sep);
			const std::string_view item = trimView(s.substr(0, pos));
			if (!item.empty()) out.emplace_back(item);
			if (pos == std::string_view::npos) break;
			s.remove_prefix(pos + 1);
		}
		return out;
	}

	//---Склейка списка через разделитель (для журнала)
	inline std::string joinList(const std::vector<std::string>& items, std::string_view sep = ", ")
	{
		std::string out;
		for (size_t i = 0; i < items.size(); i++)
		{
			if (i) out += sep;
			out += items[i];
		}
		return out;
	}

};//---namespace bklaunch
