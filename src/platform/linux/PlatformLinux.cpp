#if defined(__linux__)
#include "platform/PlatformImpl.hpp"
#include <system_error>
#include <unistd.h>

namespace unitfleet::platform {

	//---Путь к собственному исполняемому файлу (/proc/self/exe), пустой при ошибке
	fs::path selfExePath()
	{
		std::error_code ec;
		const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
		if (ec) return {};
		return exe;
	}
	//---root: эффективный uid == 0
	bool isElevated()
	{
		return ::geteuid() == 0;
	}

} // namespace unitfleet::platform
#endif
