#pragma once
#include <filesystem>
#include <map>
#include <string>
#include "Error.hpp"

namespace unitfleet {

	namespace fs = std::filesystem;

	//---Имя файла конфигурации внутри директории приложения
	inline constexpr const char* kConfigFileName = "config.toml";

	//---Конфигурация приложения (секция [systemd])
	struct AppConfig final {
		fs::path installLocation;	//	Куда копируются unit-файлы (абсолютный путь)
		bool useUser = false;		//	true → пользовательский экземпляр systemd (--user)
	};

	//---Значение TOML: строка, логическое или целое
	struct TomlValue final {
		enum class Type { String, Bool, Integer };

		Type type = Type::String;
		std::string str;
		bool boolean = false;
		long long integer = 0;
		int line = 0;				//	Строка файла, где задано значение
	};

	//---Плоский TOML-документ: "table.key" → значение
	using TomlTable = std::map<std::string, TomlValue>;

	//---Разбор подмножества TOML (комментарии, [таблицы], строки, true/false, целые)
	bool parseToml(const std::string& text, TomlTable& out, std::string* error);

	//---Чтение и проверка config.toml
	bool loadAppConfig(const fs::path& file, AppConfig& out, Error* error);

};//---namespace unitfleet
