#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "Error.hpp"

namespace unitfleet {

	namespace fs = std::filesystem;

	class IServiceController;
	class IConfirmer;

	//---Состояние приложения (вычисляется при каждом запросе, не хранится)
	enum class AppStatus {
		NotInstalled,				// Не все файлы манифеста присутствуют в targetDir
		Installed,					// Файлы на месте, unit не активен и не включён
		Stopped,					// Файлы на месте, unit включён, но не активен
		Running						// Файлы на месте, unit активен
	};

	const char* toString(AppStatus status);

	//---Приложение: директория с unit-файлами и config.toml
	class Application final {
	public:
		Application(std::string name, fs::path sourceDir, const AppConfig& config,
			IServiceController& controller);

		const std::string& name() const { return name_; }
		const fs::path& sourceDir() const { return sourceDir_; }
		const fs::path& targetDir() const { return targetDir_; }
		bool userScope() const { return userScope_; }

		//---Основной unit приложения: <name>.service
		std::string unitName() const;

		//---Путь в targetDir для относительного пути манифеста
		fs::path targetPathFor(const fs::path& relative) const;

		//---Манифест: относительные пути обычных файлов sourceDir (кроме config.toml), отсортированы
		bool manifest(std::vector<fs::path>& files, Error* error) const;

		//---Текущее состояние
		bool status(AppStatus& out, Error* error) const;

		//---Установка: проверка коллизий, копирование, daemon-reload, start
		bool install(bool dryRun, bool force, Error* error) const;

		//---Удаление: подтверждение, stop, удаление файлов, daemon-reload
		//   Отказ от подтверждения — не ошибка (возвращается true, *performed = false)
		//   performed (если указан): true только если stop / удаление / reload действительно выполнялись
		bool uninstall(bool dryRun, bool force, IConfirmer& confirmer, Error* error,
			bool* performed = nullptr) const;

		//---Журнал основного unit'а (блокирующий режим)
		bool logs(Error* error) const;

	private:
		std::string name_;
		fs::path sourceDir_;
		fs::path targetDir_;
		bool userScope_ = false;
		IServiceController& controller_;
	};

	//---Создание приложения из <fleetRoot>/<name>/config.toml
	bool loadApplication(const fs::path& fleetRoot, const std::string& name,
		IServiceController& controller, std::unique_ptr<Application>& out, Error* error);

};//---namespace unitfleet
