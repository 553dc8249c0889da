#include "unitfleet/Confirm.hpp"

#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace unitfleet {

	namespace {
		//---Подтверждение через консоль
		class ConsoleConfirmer final : public IConfirmer {
		public:
			ConsoleConfirmer(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

			bool confirm(const std::string& prompt) override
			{
				out_ << prompt << " [y/N] " << std::flush;

				std::string answer;
				if (!std::getline(in_, answer)) return false;

				//---Приводим к нижнему регистру, пробелы отбрасываем
				std::string v;
				for (char c : answer)
				{
					if (std::isspace(static_cast<unsigned char>(c))) continue;
					v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
				}
				return v == "y" || v == "yes";
			}

		private:
			std::istream& in_;
			std::ostream& out_;
		};
	} // namespace

	std::unique_ptr<IConfirmer> makeConsoleConfirmer(std::istream& in, std::ostream& out) {
		return std::make_unique<ConsoleConfirmer>(in, out);
	}
}; //---namespace unitfleet
