#pragma once
#include <string>

namespace unitfleet {

	//---Инициализация glog: цветной вывод в stderr, при заданном logDir — ещё и в файлы
	void initLogging(const char* programName, const std::string& logDir);

};//---namespace unitfleet
