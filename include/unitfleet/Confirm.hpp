#pragma once
#include <iosfwd>
#include <memory>
#include <string>

namespace unitfleet {

	//---Интерфейс интерактивного подтверждения
	class IConfirmer {
	public:
		virtual ~IConfirmer() = default;

		//---true только при явном согласии; отказ, EOF или ошибка ввода → false
		virtual bool confirm(const std::string& prompt) = 0;
	};

	//---Подтверждение через консоль (вопрос в out, ответ y/yes из in, по умолчанию "нет")
	std::unique_ptr<IConfirmer> makeConsoleConfirmer(std::istream& in, std::ostream& out);

};//---namespace unitfleet
