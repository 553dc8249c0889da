#include "unitfleet/Cli.hpp"
#include <string_view>
#include <iomanip>
#include <vector>

namespace unitfleet {
	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Удаление кавычек в начале и конце строки
	//------------------------------------------------------------
	static std::string trimQuotes(std::string v) {

		//---Если строка слишком короткая → возврат без изменений
		if (v.size() < 2) return v;

		//---Проверка на двойные или одинарные кавычки
		const bool dbl = (v.front() == '"' && v.back() == '"');
		const bool sgl = (v.front() == '\'' && v.back() == '\'');
		
		//---Если есть кавычки → удаление
		if (dbl || sgl) v = v.substr(1, v.size() - 2);

		return v;
	}
	//------------------------------------------------------------
	//	Значение опции вида --key=value (false, если аргумент не этот ключ)
	//------------------------------------------------------------
	static bool takeKv(std::string_view arg, std::string_view key, std::string& out) {
		if (!startsWith(arg, key) || arg.size() <= key.size() || arg[key.size()] != '=') return false;
		out = trimQuotes(std::string(arg.substr(key.size() + 1)));
		return true;
	}
	//------------------------------------------------------------
	//	Разбор имени команды
	//------------------------------------------------------------
	static Command parseCommand(std::string_view v) {
		if (v == "status") return Command::Status;
		if (v == "install") return Command::Install;
		if (v == "uninstall") return Command::Uninstall;
		if (v == "logs") return Command::Logs;
		if (v == "help") return Command::Help;
		return Command::Invalid;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {
	
		//---Результирующие опции
		CliOptions o;

		bool help = false;
		std::vector<std::string> positional;

		for (int i = 1; i < argc; i++)
		{
			const std::string_view a = argv[i];

			if (a == "--force") { o.force = true; continue; }
			if (a == "--dry-run") { o.dryRun = true; continue; }
			if (a == "--help" || a == "-h") { help = true; continue; }
			if (takeKv(a, "--root", o.root)) continue;
			if (takeKv(a, "--log-dir", o.logDir)) continue;

			//---Неизвестная опция → Invalid
			if (startsWith(a, "-"))
			{
				o.cmd = Command::Invalid;
				return o;
			}
			positional.emplace_back(a);
		}

		//---Явный запрос справки
		if (help)
		{
			o.cmd = Command::Help;
			return o;
		}
		//---Если не указана команда → Help
		if (positional.empty())
		{
			o.cmd = Command::Help;
			return o;
		}
		//---Команда и не более одного имени приложения
		o.cmd = parseCommand(positional[0]);
		if (o.cmd == Command::Invalid || positional.size() > 2)
		{
			o.cmd = Command::Invalid;
			return o;
		}
		if (positional.size() == 2)
		{
			if (o.cmd == Command::Help)
			{
				o.cmd = Command::Invalid;
				return o;
			}
			o.name = positional[1];
		}

		//---logs требует имя приложения
		if (o.cmd == Command::Logs && o.name.empty()) o.cmd = Command::Invalid;
		
		//---Возврат опций
		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 20)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"unitfleet\n\n"
			"Usage:\n"
			"  unitfleet <command> [name] [options]\n\n"
			"Commands:\n";

		printOpt(os, "status [name]", "Show status of one app or of all apps");
		printOpt(os, "install [name]", "Copy unit files, reload systemd and start the app(s)");
		printOpt(os, "uninstall [name]", "Stop the app(s), remove unit files and reload systemd");
		printOpt(os, "logs <name>", "Follow the journal of an app (Ctrl+C to exit)");

		os << "\nOptions:\n";
		printOpt(os, "--force", "Overwrite existing files, skip confirmations");
		printOpt(os, "--dry-run", "Show plan without executing");
		printOpt(os, "--root=<path>", "Directory with apps (default: directory of unitfleet)");
		printOpt(os, "--log-dir=<path>", "Also write log files to this directory");
		printOpt(os, "--help, -h", "Show this help");

		os <<
			"\nEach app is a directory <root>/<name>/ with unit files and a config.toml:\n"
			"  [systemd]\n"
			"  install_location = \"/etc/systemd/system\"\n"
			"  use_user = false\n"
			"\nExamples:\n"
			"  unitfleet status\n"
			"  unitfleet install webapp --dry-run\n"
			"  unitfleet install --force\n"
			"  unitfleet uninstall webapp --force\n"
			"  unitfleet logs webapp\n";
	}
};//---namespace unitfleet
