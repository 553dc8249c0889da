#pragma once
#include <filesystem>
#include <string>

namespace unitfleet {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл unitfleet
	fs::path selfDir();
	
	//--Определение корня парка приложений:
	//	Если rootArg пустой → selfDir()
	//	Если rootArg относительный путь → текущая директория / rootArg
	//	Если rootArg абсолютный путь → остаётся без изменений
	fs::path resolveFleetRoot(const std::string& rootArg);

};//---namespace unitfleet
