#pragma once
#include <string>
#include <iostream>

namespace unitfleet {

	//---Команды CLI
	enum class Command {
	Help,
	Status,
	Install,
	Uninstall,
	Logs,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {
	
		//---Команда
		Command cmd = Command::Help;

		//---Имя приложения (пусто → все приложения, кроме logs)
		std::string name;

		//---Пути
		std::string root;			//	--root=<path>, пусто → директория исполняемого файла
		std::string logDir;			//	--log-dir=<path>, пусто → только stderr

		//---Флаги
		bool force = false;			//	Перезапись файлов / без подтверждений
		bool dryRun = false;		//	Только показать план
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

};//---namespace unitfleet
