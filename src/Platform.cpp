#include "unitfleet/Platform.hpp"
#include "platform/PlatformImpl.hpp"

namespace unitfleet {
	//------------------------------------------------------------
	//	Проверка прав администратора
	//------------------------------------------------------------
	bool requireAdminRoot() {
		return platform::isElevated();
	}
	//------------------------------------------------------------
	//	Создание контроллера для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IServiceController> makeController(const ToolPaths& paths) {
		return platform::makeController(paths);
	}
}; //---namespace unitfleet
