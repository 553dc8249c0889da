#include "unitfleet/Fleet.hpp"
#include "unitfleet/Confirm.hpp"
#include "unitfleet/ServiceController.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <glog/logging.h>

namespace unitfleet {

	Fleet::Fleet(FleetOptions options, IServiceController& controller, IConfirmer& confirmer)
		: options_(std::move(options)), controller_(controller), confirmer_(confirmer)
	{
	}
	//------------------------------------------------------------
	//	Обнаружение приложений: каждая директория корня (без '.') — приложение
	//	Директория без корректного config.toml — ошибка для всего парка
	//------------------------------------------------------------
	bool Fleet::discover(std::vector<std::unique_ptr<Application>>& apps, Error* error) const {

		apps.clear();

		std::error_code ec;
		fs::directory_iterator it(options_.root, ec);
		if (ec)
		{
			return fail(error, ErrorKind::Config, "Failed to list fleet root " + options_.root.string() + ": " + ec.message());
		}

		std::vector<std::string> names;
		for (; it != fs::directory_iterator(); it.increment(ec))
		{
			if (ec) break;

			std::error_code typeEc;
			if (!it->is_directory(typeEc)) continue;

			const std::string name = it->path().filename().string();
			if (name.empty() || name.front() == '.') continue;
			names.push_back(name);
		}
		if (ec)
		{
			return fail(error, ErrorKind::Config, "Failed to list fleet root " + options_.root.string() + ": " + ec.message());
		}

		std::sort(names.begin(), names.end());

		for (const auto& name : names)
		{
			std::unique_ptr<Application> app;
			if (!loadApplication(options_.root, name, controller_, app, error))
			{
				apps.clear();
				return false;
			}
			apps.push_back(std::move(app));
		}
		return true;
	}

	bool Fleet::select(const std::string& name, std::vector<std::unique_ptr<Application>>& apps,
		Error* error) const {

		if (name.empty()) return discover(apps, error);

		apps.clear();
		std::unique_ptr<Application> app;
		if (!loadApplication(options_.root, name, controller_, app, error)) return false;
		apps.push_back(std::move(app));
		return true;
	}
	//------------------------------------------------------------
	//	Состояние одного / всех приложений
	//------------------------------------------------------------
	bool Fleet::status(const std::string& name, std::vector<StatusEntry>& out, Error* error) const {

		out.clear();

		std::vector<std::unique_ptr<Application>> apps;
		if (!select(name, apps, error)) return false;

		if (apps.empty())
		{
			LOG(WARNING) << "No apps found";
			return true;
		}

		for (const auto& app : apps)
		{
			StatusEntry entry;
			entry.name = app->name();
			if (!app->status(entry.status, error)) return false;

			LOG(INFO) << "Status for " << entry.name << ": " << toString(entry.status);
			out.push_back(std::move(entry));
		}
		return true;
	}
	//------------------------------------------------------------
	//	Установка одного / всех приложений (первая ошибка прерывает пакет)
	//------------------------------------------------------------
	bool Fleet::install(const std::string& name, Error* error) const {

		std::vector<std::unique_ptr<Application>> apps;
		if (!select(name, apps, error)) return false;

		if (apps.empty())
		{
			LOG(WARNING) << "No apps found";
			return true;
		}

		for (const auto& app : apps)
		{
			if (name.empty()) LOG(INFO) << "Installing app " << app->name();

			if (!app->install(options_.dryRun, options_.force, error)) return false;

			if (!options_.dryRun) LOG(INFO) << "App " << app->name() << " installed and started";
		}
		return true;
	}
	//------------------------------------------------------------
	//	Удаление одного / всех приложений (первая ошибка прерывает пакет)
	//------------------------------------------------------------
	bool Fleet::uninstall(const std::string& name, Error* error) const {

		std::vector<std::unique_ptr<Application>> apps;
		if (!select(name, apps, error)) return false;

		if (apps.empty())
		{
			LOG(WARNING) << "No apps found";
			return true;
		}

		for (const auto& app : apps)
		{
			if (name.empty()) LOG(INFO) << "Uninstalling app " << app->name();

			bool performed = false;
			if (!app->uninstall(options_.dryRun, options_.force, confirmer_, error, &performed)) return false;

			if (performed) LOG(INFO) << "App " << app->name() << " uninstalled";
		}
		return true;
	}
	//------------------------------------------------------------
	//	Журнал приложения (имя обязательно)
	//------------------------------------------------------------
	bool Fleet::logs(const std::string& name, Error* error) const {

		std::unique_ptr<Application> app;
		if (!loadApplication(options_.root, name, controller_, app, error)) return false;

		LOG(INFO) << "Showing logs for " << name << " (Press Ctrl+C to exit)";
		return app->logs(error);
	}
}; //---namespace unitfleet
