#pragma once
#include <memory>
#include "ServiceController.hpp"

namespace unitfleet {

	//---Запуск с правами администратора
	bool requireAdminRoot();

	//---Создание контроллера менеджера служб для текущей платформы
	std::unique_ptr<IServiceController> makeController(const ToolPaths& paths = {});

};//---namespace unitfleet
