#pragma once
#include <string>

namespace unitfleet {

	//---Категории ошибок
	enum class ErrorKind {
		None,
		Config,						// Нет / некорректный config.toml
		Manifest,					// Не удалось прочитать дерево файлов приложения
		EmptyManifest,				// В приложении нет файлов для установки
		Collision,					// Целевой файл уже существует (без --force)
		Copy,						// Ошибка копирования файла
		ServiceCommand,				// Ошибка изменяющей команды systemctl / journalctl
		Privilege					// Процесс запущен без прав root
	};

	//---Описание ошибки
	struct Error final {
		ErrorKind kind = ErrorKind::None;
		std::string message;
	};

	//---Имя категории для вывода в лог
	const char* toString(ErrorKind kind);

	//---Заполняет *error (если указан) и возвращает false
	bool fail(Error* error, ErrorKind kind, std::string message);

};//---namespace unitfleet
