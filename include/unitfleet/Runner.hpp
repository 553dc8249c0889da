#pragma once
#include "Cli.hpp"

namespace unitfleet {

	class IServiceController;
	class IConfirmer;

	//---Оркестратор: проверка прав root, создание контроллера и выполнение команды
	int runCommand(const CliOptions& opt);

	//---Выполнение команды с заданными контроллером и подтверждением (без проверки прав)
	int dispatch(const CliOptions& opt, IServiceController& controller, IConfirmer& confirmer);

};//---namespace unitfleet
