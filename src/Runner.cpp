#include "unitfleet/Runner.hpp"
#include "unitfleet/Confirm.hpp"
#include "unitfleet/Error.hpp"
#include "unitfleet/Fleet.hpp"
#include "unitfleet/Paths.hpp"
#include "unitfleet/Platform.hpp"
#include "unitfleet/ServiceController.hpp"

#include <iostream>
#include <vector>
#include <glog/logging.h>

namespace unitfleet {

	//------------------------------------------------------------
	//	Логирование ошибки и возврат кода ошибки
	//------------------------------------------------------------
	static int fail(const Error& err) {
		LOG(ERROR) << toString(err.kind) << ": " << err.message;
		return 1;
	}
	//------------------------------------------------------------
	//	Выполнение команды над парком приложений
	//------------------------------------------------------------
	int dispatch(const CliOptions& opt, IServiceController& controller, IConfirmer& confirmer) {

		FleetOptions fo;
		fo.root = resolveFleetRoot(opt.root);
		fo.force = opt.force;
		fo.dryRun = opt.dryRun;

		const Fleet fleet(fo, controller, confirmer);

		Error err;
		switch (opt.cmd)
		{
		case Command::Status:
		{
			std::vector<StatusEntry> entries;
			if (!fleet.status(opt.name, entries, &err)) return fail(err);
			return 0;
		}
		case Command::Install:
			if (!fleet.install(opt.name, &err)) return fail(err);
			return 0;
		case Command::Uninstall:
			if (!fleet.uninstall(opt.name, &err)) return fail(err);
			return 0;
		case Command::Logs:
			if (!fleet.logs(opt.name, &err)) return fail(err);
			return 0;
		case Command::Help:
		case Command::Invalid:
			break;
		}
		return 2;
	}
	//------------------------------------------------------------
	//	Оркестратор: проверка прав и запуск команды
	//------------------------------------------------------------
	int runCommand(const CliOptions& opt) {

		//---Проверка прав администратора / root
		if (!requireAdminRoot()) return fail({ ErrorKind::Privilege, "Administrator/root privileges required." });

		//---Создание контроллера systemd и консольного подтверждения
		auto controller = makeController();
		if (!controller) return fail({ ErrorKind::ServiceCommand, "Service manager is not available on this platform." });
		auto confirmer = makeConsoleConfirmer(std::cin, std::cout);

		return dispatch(opt, *controller, *confirmer);
	}
}; //---namespace unitfleet
