#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "Application.hpp"
#include "Error.hpp"

namespace unitfleet {

	namespace fs = std::filesystem;

	class IServiceController;
	class IConfirmer;

	//---Глобальная политика запуска
	struct FleetOptions final {
		fs::path root;				//	Корень парка: <root>/<appName>/...
		bool force = false;			//	Перезапись файлов / без подтверждений
		bool dryRun = false;		//	Только показать план
	};

	//---Результат запроса состояния одного приложения
	struct StatusEntry final {
		std::string name;
		AppStatus status = AppStatus::NotInstalled;
	};

	//---Менеджер парка приложений
	//   Пустое имя в status/install/uninstall → все обнаруженные приложения
	class Fleet final {
	public:
		Fleet(FleetOptions options, IServiceController& controller, IConfirmer& confirmer);

		const FleetOptions& options() const { return options_; }

		//---Обнаружение приложений (директории корня без '.' в начале, по алфавиту)
		bool discover(std::vector<std::unique_ptr<Application>>& apps, Error* error) const;

		bool status(const std::string& name, std::vector<StatusEntry>& out, Error* error) const;
		bool install(const std::string& name, Error* error) const;
		bool uninstall(const std::string& name, Error* error) const;
		bool logs(const std::string& name, Error* error) const;

	private:
		//---Одно приложение по имени или все обнаруженные
		bool select(const std::string& name, std::vector<std::unique_ptr<Application>>& apps,
			Error* error) const;

		FleetOptions options_;
		IServiceController& controller_;
		IConfirmer& confirmer_;
	};

};//---namespace unitfleet
