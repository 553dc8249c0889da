#pragma once
#include <filesystem>
#include <memory>
#include "unitfleet/ServiceController.hpp"

namespace unitfleet {

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Проверка, что процесс запущен с правами root
		bool isElevated();
		//---Cоздание контроллера менеджера служб для текущей платформы
		std::unique_ptr<IServiceController> makeController(const ToolPaths& paths);
	}

} // namespace unitfleet
