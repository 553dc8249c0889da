#include "unitfleet/Paths.hpp"
#include "platform/PlatformImpl.hpp"

namespace unitfleet {

	//---Директория, в которой находится исполняемый файл unitfleet
	fs::path selfDir() {
		
		//---Получение пути к собственному исполняемому файлу
		const fs::path exe = platform::selfExePath();

		//---Возврат родительской директории или текущей директории, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		return fs::current_path();
	}
	//---Определение корня парка приложений
	fs::path resolveFleetRoot(const std::string& rootArg) {
		
		//---По умолчанию приложения лежат рядом с исполняемым файлом
		if (rootArg.empty())
		{
			return selfDir();
		}
		
		//---Формирование пути
		fs::path p(rootArg);
		
		//---Если путь относительный → относительно текущей директории
		if (p.is_relative())
		{ 
			std::error_code ec;
			const fs::path cwd = fs::current_path(ec);
			if (!ec) p = (cwd / p).lexically_normal();
		}
		return p;
	}
} // namespace unitfleet
