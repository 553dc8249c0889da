#pragma once
#include <filesystem>
#include <string>
#include "Error.hpp"

namespace unitfleet {

	namespace fs = std::filesystem;

	//---Пути к утилитам менеджера служб
	struct ToolPaths final {
		fs::path systemctl = "/bin/systemctl";
		fs::path journalctl = "/bin/journalctl";
	};

	//---Интерфейс управления отдельным unit'ом менеджера служб
	//   userScope = true → команды адресуются пользовательскому экземпляру (--user)
	class IServiceController {
	public:
		virtual ~IServiceController() = default;

		//---Запросы состояния: любая неоднозначность (unit не найден, systemctl недоступен) → false
		virtual bool isActive(const std::string& unit, bool userScope) = 0;
		virtual bool isEnabled(const std::string& unit, bool userScope) = 0;

		//---Изменяющие команды: ошибка возвращается вызывающему (ErrorKind::ServiceCommand)
		virtual bool start(const std::string& unit, bool userScope, Error* error) = 0;
		virtual bool stop(const std::string& unit, bool userScope, Error* error) = 0;
		virtual bool reload(bool userScope, Error* error) = 0;

		//---Вывод журнала unit'а в режиме follow (блокирует до прерывания)
		virtual bool followLogs(const std::string& unit, bool userScope, Error* error) = 0;
	};

};//---namespace unitfleet
