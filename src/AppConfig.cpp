#include "unitfleet/AppConfig.hpp"

#include <cctype>
#include <climits>
#include <fstream>
#include <sstream>
#include <string_view>

namespace unitfleet {
	//------------------------------------------------------------
	//	Удаление пробелов в начале и конце строки
	//------------------------------------------------------------
	static std::string_view trim(std::string_view s) {
		while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
		while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
		return s;
	}
	//------------------------------------------------------------
	//	Проверка имени ключа / таблицы: A-Za-z0-9_- и точки между частями
	//------------------------------------------------------------
	static bool isValidKey(std::string_view k) {
		if (k.empty() || k.front() == '.' || k.back() == '.') return false;
		char prev = 0;
		for (char c : k)
		{
			const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
			if (!ok) return false;
			if (c == '.' && prev == '.') return false;
			prev = c;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Отрезание комментария (# вне строки)
	//------------------------------------------------------------
	static std::string_view stripComment(std::string_view s) {
		char quote = 0;
		for (size_t i = 0; i < s.size(); i++)
		{
			const char c = s[i];
			if (quote)
			{
				if (quote == '"' && c == '\\') { i++; continue; }
				if (c == quote) quote = 0;
				continue;
			}
			if (c == '"' || c == '\'') quote = c;
			else if (c == '#') return s.substr(0, i);
		}
		return s;
	}
	//------------------------------------------------------------
	//	Разбор строки в двойных кавычках с экранированием
	//------------------------------------------------------------
	static bool parseBasicString(std::string_view v, std::string& out) {
		if (v.size() < 2 || v.front() != '"' || v.back() != '"') return false;
		v = v.substr(1, v.size() - 2);

		out.clear();
		for (size_t i = 0; i < v.size(); i++)
		{
			const char c = v[i];
			if (c == '"') return false;		//	Неэкранированная кавычка внутри строки
			if (c != '\\') { out.push_back(c); continue; }

			if (++i >= v.size()) return false;
			switch (v[i])
			{
			case '"': out.push_back('"'); break;
			case '\\': out.push_back('\\'); break;
			case 'n': out.push_back('\n'); break;
			case 't': out.push_back('\t'); break;
			case 'r': out.push_back('\r'); break;
			default: return false;
			}
		}
		return true;
	}
	//------------------------------------------------------------
	//	Разбор значения: строка, true/false или целое
	//------------------------------------------------------------
	static bool parseValue(std::string_view v, TomlValue& out) {
		if (v.empty()) return false;

		if (v.front() == '"')
		{
			out.type = TomlValue::Type::String;
			return parseBasicString(v, out.str);
		}
		if (v.front() == '\'')
		{
			//---Литеральная строка: без экранирования
			if (v.size() < 2 || v.back() != '\'') return false;
			const std::string_view body = v.substr(1, v.size() - 2);
			if (body.find('\'') != std::string_view::npos) return false;
			out.type = TomlValue::Type::String;
			out.str = std::string(body);
			return true;
		}
		if (v == "true" || v == "false")
		{
			out.type = TomlValue::Type::Bool;
			out.boolean = (v == "true");
			return true;
		}

		//---Целое со знаком, допускаются '_' между цифрами
		size_t i = 0;
		bool negative = false;
		if (v[0] == '+' || v[0] == '-') { negative = (v[0] == '-'); i = 1; }
		if (i >= v.size()) return false;

		//---Модуль не больше LLONG_MAX (для отрицательных — LLONG_MAX + 1)
		const unsigned long long limit = negative
			? static_cast<unsigned long long>(LLONG_MAX) + 1ULL
			: static_cast<unsigned long long>(LLONG_MAX);

		unsigned long long n = 0;
		bool lastDigit = false;
		for (; i < v.size(); i++)
		{
			const char c = v[i];
			if (c == '_' && lastDigit) { lastDigit = false; continue; }
			if (c < '0' || c > '9') return false;

			const unsigned long long digit = static_cast<unsigned long long>(c - '0');
			if (n > (limit - digit) / 10) return false;	//	Выход за диапазон long long
			n = n * 10 + digit;
			lastDigit = true;
		}
		if (!lastDigit) return false;

		out.type = TomlValue::Type::Integer;
		if (!negative) out.integer = static_cast<long long>(n);
		else if (n == limit) out.integer = LLONG_MIN;
		else out.integer = -static_cast<long long>(n);
		return true;
	}
	//------------------------------------------------------------
	//	Разбор подмножества TOML в плоскую таблицу "table.key"
	//------------------------------------------------------------
	bool parseToml(const std::string& text, TomlTable& out, std::string* error) {

		out.clear();

		std::string table;
		std::istringstream in(text);
		std::string rawLine;
		int lineNo = 0;

		auto lineError = [&](const std::string& what) {
			if (error)
			{
				std::ostringstream os;
				os << "line " << lineNo << ": " << what;
				*error = os.str();
			}
			return false;
		};

		while (std::getline(in, rawLine))
		{
			++lineNo;
			const std::string_view line = trim(stripComment(rawLine));
			if (line.empty()) continue;

			//---Заголовок таблицы [name]
			if (line.front() == '[')
			{
				if (line.size() < 3 || line.back() != ']' || line[1] == '[')
					return lineError("malformed table header");

				const std::string_view name = trim(line.substr(1, line.size() - 2));
				if (!isValidKey(name)) return lineError("invalid table name");
				table = std::string(name);
				continue;
			}

			//---Пара key = value
			const size_t eq = line.find('=');
			if (eq == std::string_view::npos) return lineError("expected key = value");

			const std::string_view key = trim(line.substr(0, eq));
			if (!isValidKey(key)) return lineError("invalid key");

			TomlValue value;
			if (!parseValue(trim(line.substr(eq + 1)), value)) return lineError("invalid value for key '" + std::string(key) + "'");
			value.line = lineNo;

			const std::string fullKey = table.empty() ? std::string(key) : table + "." + std::string(key);
			if (!out.emplace(fullKey, std::move(value)).second)
				return lineError("duplicate key '" + fullKey + "'");
		}
		return true;
	}
	//------------------------------------------------------------
	//	Чтение и проверка config.toml
	//------------------------------------------------------------
	bool loadAppConfig(const fs::path& file, AppConfig& out, Error* error) {

		const std::string where = file.string();

		//---Чтение файла
		std::ifstream f(file, std::ios::binary);
		if (!f)
		{
			return fail(error, ErrorKind::Config, "Failed to find config file at " + where);
		}
		std::ostringstream buf;
		buf << f.rdbuf();
		if (f.bad())
		{
			return fail(error, ErrorKind::Config, "Failed to read config file " + where);
		}

		//---Разбор
		TomlTable doc;
		std::string parseErr;
		if (!parseToml(buf.str(), doc, &parseErr))
		{
			return fail(error, ErrorKind::Config, where + ": " + parseErr);
		}

		//---systemd.install_location: обязательная строка, абсолютный путь, не "/"
		const auto loc = doc.find("systemd.install_location");
		if (loc == doc.end())
		{
			return fail(error, ErrorKind::Config, where + ": missing required key systemd.install_location");
		}
		if (loc->second.type != TomlValue::Type::String)
		{
			return fail(error, ErrorKind::Config, where + ": systemd.install_location must be a string");
		}
		const fs::path installLocation(loc->second.str);
		if (installLocation.empty() || !installLocation.is_absolute())
		{
			return fail(error, ErrorKind::Config, where + ": systemd.install_location must be an absolute path");
		}
		if (installLocation.lexically_normal() == installLocation.root_path())
		{
			return fail(error, ErrorKind::Config, where + ": refuse to use root directory as systemd.install_location");
		}

		//---systemd.use_user: обязательное логическое значение
		const auto user = doc.find("systemd.use_user");
		if (user == doc.end())
		{
			return fail(error, ErrorKind::Config, where + ": missing required key systemd.use_user");
		}
		if (user->second.type != TomlValue::Type::Bool)
		{
			return fail(error, ErrorKind::Config, where + ": systemd.use_user must be true or false");
		}

		out.installLocation = installLocation;
		out.useUser = user->second.boolean;
		return true;
	}
}; //---namespace unitfleet
