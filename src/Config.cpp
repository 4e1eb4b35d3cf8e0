#include "backend_launcher/Config.hpp"
#include "backend_launcher/Strings.hpp"

#include <cstdlib>
#include <system_error>

namespace bklaunch {
	//------------------------------------------------------------
	//	Имена переменных окружения
	//------------------------------------------------------------
	static constexpr const char* kEnvPython = "BACKEND_LAUNCHER_PYTHON";
	static constexpr const char* kEnvModule = "BACKEND_LAUNCHER_MODULE";
	static constexpr const char* kEnvPip = "BACKEND_LAUNCHER_PIP";
	static constexpr const char* kEnvLog = "BACKEND_LAUNCHER_LOG";
	static constexpr const char* kEnvProtected = "BACKEND_LAUNCHER_PROTECTED";
	static constexpr const char* kEnvRequired = "BACKEND_LAUNCHER_REQUIRED";
	static constexpr const char* kEnvVerbose = "BACKEND_LAUNCHER_VERBOSE";

	//------------------------------------------------------------
	//	Получение значения переменной без кавычек и пробелов
	//------------------------------------------------------------
	static std::optional<std::string> getValue(const EnvLookup& env, const std::string& key)
	{
		if (!env) return std::nullopt;

		const auto raw = env(key);
		if (!raw) return std::nullopt;

		//---Пустое значение считаем отсутствующим
		const std::string v(trimQuotesView(trimView(*raw)));
		if (v.empty()) return std::nullopt;
		return v;
	}
	//------------------------------------------------------------
	//	Парсинг флага (1|true|yes|on)
	//------------------------------------------------------------
	static bool parseFlag(std::string v)
	{
		//---Приводим к нижнему регистру
		for (char& c : v) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');

		return v == "1" || v == "true" || v == "yes" || v == "on";
	}
	//------------------------------------------------------------
	//	Путь интерпретатора с каталогом, но относительный, привязывается к
	//	текущему каталогу лаунчера (бэкенд запускается в другом каталоге).
	//	Имя без каталога остаётся как есть: его ищет PATH
	//------------------------------------------------------------
	static std::string resolveInterpreter(const std::string& v)
	{
		const fs::path p(v);
		if (!p.has_parent_path() || p.is_absolute()) return v;

		std::error_code ec;
		const fs::path abs = fs::absolute(p, ec);
		if (ec) return v;
		return abs.lexically_normal().string();
	}
	//------------------------------------------------------------
	//	Переменные окружения текущего процесса
	//------------------------------------------------------------
	EnvLookup systemEnv()
	{
		return [](const std::string& name) -> std::optional<std::string> {
			const char* v = std::getenv(name.c_str());
			if (!v) return std::nullopt;
			return std::string(v);
		};
	}
	//------------------------------------------------------------
	//	Журнал во временном каталоге системы
	//------------------------------------------------------------
	fs::path defaultLogPath()
	{
		std::error_code ec;
		fs::path tmp = fs::temp_directory_path(ec);
		if (ec || tmp.empty()) tmp = fs::path(".");
		return tmp / "backend-launch.log";
	}
	//------------------------------------------------------------
	//	Загрузка настроек
	//------------------------------------------------------------
	LaunchConfig loadConfig(const EnvLookup& env)
	{
		LaunchConfig cfg;
		cfg.logPath = defaultLogPath();

		if (auto v = getValue(env, kEnvPython)) cfg.interpreter = resolveInterpreter(*v);
		if (auto v = getValue(env, kEnvModule)) cfg.module = *v;
		if (auto v = getValue(env, kEnvPip)) cfg.packageManager = *v;
		if (auto v = getValue(env, kEnvLog)) cfg.logPath = fs::path(*v);

		//---Списки через запятую; пустой список не заменяет значения по умолчанию
		if (auto v = getValue(env, kEnvProtected))
		{
			auto items = splitList(*v);
			if (!items.empty()) cfg.protectedPackages = std::move(items);
		}
		if (auto v = getValue(env, kEnvRequired))
		{
			auto items = splitList(*v);
			if (!items.empty()) cfg.requiredModules = std::move(items);
		}

		if (auto v = getValue(env, kEnvVerbose)) cfg.verbose = parseFlag(*v);

		return cfg;
	}
	//------------------------------------------------------------
	//	Описание настроек для журнала запуска
	//------------------------------------------------------------
	std::vector<std::string> describeConfig(const LaunchConfig& cfg)
	{
		return {
			"interpreter: " + cfg.interpreter,
			"module: " + cfg.module,
			"package manager: " + cfg.packageManager,
			"required modules: " + joinList(cfg.requiredModules),
			"protected packages: " + joinList(cfg.protectedPackages),
			"log file: " + cfg.logPath.string(),
		};
	}
};//---namespace bklaunch
