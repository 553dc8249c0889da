#include <iostream>
#include "unitfleet/Cli.hpp"
#include "unitfleet/Logging.hpp"
#include "unitfleet/Runner.hpp"

int main(int argc, char** argv) {
	
	//---Разбор аргументов командной строки
	const unitfleet::CliOptions opt = unitfleet::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == unitfleet::Command::Help || opt.cmd == unitfleet::Command::Invalid) 
	{
		unitfleet::printHelp(std::cout);
		return (opt.cmd == unitfleet::Command::Invalid) ? 2 : 0;
	}

	//---Инициализация логгера
	unitfleet::initLogging(argv[0], opt.logDir);

	//---Запуск команды с заданными опциями
	return unitfleet::runCommand(opt);
}
