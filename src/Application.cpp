#include "unitfleet/Application.hpp"
#include "unitfleet/Confirm.hpp"
#include "unitfleet/ServiceController.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <glog/logging.h>

namespace unitfleet {
	//------------------------------------------------------------
	//	Отображаемое имя состояния
	//------------------------------------------------------------
	const char* toString(AppStatus status) {
		switch (status)
		{
		case AppStatus::NotInstalled: return "Not Installed";
		case AppStatus::Installed: return "Installed";
		case AppStatus::Stopped: return "Stopped";
		case AppStatus::Running: return "Running";
		}
		return "Unknown";
	}
	//------------------------------------------------------------
	//	Конструктор: identity + параметры из config.toml
	//------------------------------------------------------------
	Application::Application(std::string name, fs::path sourceDir, const AppConfig& config,
		IServiceController& controller)
		: name_(std::move(name)),
		  sourceDir_(std::move(sourceDir)),
		  targetDir_(config.installLocation),
		  userScope_(config.useUser),
		  controller_(controller)
	{
	}

	std::string Application::unitName() const {
		return name_ + ".service";
	}

	fs::path Application::targetPathFor(const fs::path& relative) const {
		return targetDir_ / relative;
	}
	//------------------------------------------------------------
	//	Манифест: рекурсивный обход sourceDir
	//------------------------------------------------------------
	bool Application::manifest(std::vector<fs::path>& files, Error* error) const {

		files.clear();

		std::error_code ec;
		if (!fs::is_directory(sourceDir_, ec))
		{
			return fail(error, ErrorKind::Manifest, "Application directory does not exist: " + sourceDir_.string());
		}

		fs::recursive_directory_iterator it(sourceDir_, ec);
		if (ec)
		{
			return fail(error, ErrorKind::Manifest, "Failed to read " + sourceDir_.string() + ": " + ec.message());
		}

		for (; it != fs::recursive_directory_iterator(); it.increment(ec))
		{
			if (ec) break;

			//---Директории не входят в манифест
			std::error_code typeEc;
			if (!it->is_regular_file(typeEc)) continue;

			const fs::path relative = it->path().lexically_relative(sourceDir_);
			if (relative == fs::path(kConfigFileName)) continue;

			files.push_back(relative);
		}
		if (ec)
		{
			files.clear();
			return fail(error, ErrorKind::Manifest, "Failed to walk " + sourceDir_.string() + ": " + ec.message());
		}

		std::sort(files.begin(), files.end());
		return true;
	}
	//------------------------------------------------------------
	//	Состояние: файлы → is-active → is-enabled
	//------------------------------------------------------------
	bool Application::status(AppStatus& out, Error* error) const {

		std::vector<fs::path> files;
		if (!manifest(files, error)) return false;

		//---Все файлы манифеста должны присутствовать в targetDir (пустой манифест — присутствует)
		for (const auto& rel : files)
		{
			std::error_code ec;
			if (!fs::exists(targetPathFor(rel), ec))
			{
				out = AppStatus::NotInstalled;
				return true;
			}
		}

		const std::string unit = unitName();
		if (controller_.isActive(unit, userScope_))
		{
			out = AppStatus::Running;
		}
		else if (controller_.isEnabled(unit, userScope_))
		{
			out = AppStatus::Stopped;
		}
		else
		{
			out = AppStatus::Installed;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Установка
	//------------------------------------------------------------
	bool Application::install(bool dryRun, bool force, Error* error) const {

		std::vector<fs::path> files;
		if (!manifest(files, error)) return false;
		if (files.empty())
		{
			return fail(error, ErrorKind::EmptyManifest, "No files found for app " + name_);
		}

		const char* scopeNote = userScope_ ? " as user" : "";

		//---Пробный запуск: только план
		if (dryRun)
		{
			LOG(INFO) << "[DRY RUN] Would install app " << name_;
			for (const auto& rel : files)
			{
				LOG(INFO) << "[DRY RUN] Would copy " << (sourceDir_ / rel).string()
					<< " to " << targetPathFor(rel).string();
			}
			LOG(INFO) << "[DRY RUN] Would reload systemd and start " << unitName() << scopeNote;
			return true;
		}

		//---Проверка коллизий по всему манифесту до любых изменений
		if (!force)
		{
			for (const auto& rel : files)
			{
				const fs::path target = targetPathFor(rel);
				std::error_code ec;
				if (fs::exists(target, ec))
				{
					LOG(WARNING) << "File " << target.string() << " already exists. Use --force to overwrite.";
					return fail(error, ErrorKind::Collision, "File already exists and --force not used: " + target.string());
				}
			}
		}

		//---Копирование (уже скопированные файлы при ошибке остаются на месте)
		for (const auto& rel : files)
		{
			const fs::path source = sourceDir_ / rel;
			const fs::path target = targetPathFor(rel);

			std::error_code ec;
			fs::create_directories(target.parent_path(), ec);
			if (ec)
			{
				return fail(error, ErrorKind::Copy, "Failed to create directory " + target.parent_path().string()
					+ " for " + source.string() + ": " + ec.message());
			}

			fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
			if (ec)
			{
				return fail(error, ErrorKind::Copy, "Failed to copy " + source.string() + " to " + target.string()
					+ ": " + ec.message());
			}
			LOG(INFO) << "Copied " << rel.string();
		}

		//---daemon-reload и запуск основного unit'а
		if (!controller_.reload(userScope_, error)) return false;
		if (!controller_.start(unitName(), userScope_, error)) return false;

		return true;
	}
	//------------------------------------------------------------
	//	Удаление
	//------------------------------------------------------------
	bool Application::uninstall(bool dryRun, bool force, IConfirmer& confirmer, Error* error,
		bool* performed) const {

		if (performed) *performed = false;

		std::vector<fs::path> files;
		if (!manifest(files, error)) return false;
		if (files.empty())
		{
			return fail(error, ErrorKind::EmptyManifest, "No files found for app " + name_);
		}

		//---Пробный запуск: только план
		if (dryRun)
		{
			LOG(INFO) << "[DRY RUN] Would stop " << unitName();
			for (const auto& rel : files)
			{
				LOG(INFO) << "[DRY RUN] Would remove " << targetPathFor(rel).string();
			}
			LOG(INFO) << "[DRY RUN] Would reload systemd";
			return true;
		}

		//---Подтверждение; отказ — штатный выход без изменений
		if (!force)
		{
			if (!confirmer.confirm("Are you sure you want to uninstall " + name_ + "?"))
			{
				LOG(INFO) << "Uninstall cancelled";
				return true;
			}
		}

		if (performed) *performed = true;

		//---Остановка best-effort: unit может быть уже остановлен или отсутствовать
		{
			Error stopErr;
			if (!controller_.stop(unitName(), userScope_, &stopErr))
				LOG(WARNING) << "Failed to stop " << unitName() << ": " << stopErr.message;
		}

		//---Удаление файлов best-effort: ошибки по отдельным файлам не прерывают удаление
		for (const auto& rel : files)
		{
			const fs::path target = targetPathFor(rel);
			std::error_code ec;
			const bool removed = fs::remove(target, ec);
			if (ec)
			{
				LOG(WARNING) << "Failed to remove " << target.string() << ": " << ec.message();
				continue;
			}
			if (removed) LOG(INFO) << "Removed file " << target.string();
		}

		//---daemon-reload обязателен: иначе systemd не узнает об удалённых unit'ах
		Error reloadErr;
		if (!controller_.reload(userScope_, &reloadErr))
		{
			return fail(error, ErrorKind::ServiceCommand,
				"Failed to reload systemd after stopping service and removing files: " + reloadErr.message);
		}
		return true;
	}
	//------------------------------------------------------------
	//	Журнал
	//------------------------------------------------------------
	bool Application::logs(Error* error) const {
		return controller_.followLogs(unitName(), userScope_, error);
	}
	//------------------------------------------------------------
	//	Создание приложения из <fleetRoot>/<name>/config.toml
	//------------------------------------------------------------
	bool loadApplication(const fs::path& fleetRoot, const std::string& name,
		IServiceController& controller, std::unique_ptr<Application>& out, Error* error) {

		//---Имя — простое имя директории
		if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
		{
			return fail(error, ErrorKind::Config, "Invalid application name '" + name + "'");
		}

		const fs::path sourceDir = fleetRoot / name;

		AppConfig config;
		if (!loadAppConfig(sourceDir / kConfigFileName, config, error)) return false;

		out = std::make_unique<Application>(name, sourceDir, config, controller);
		return true;
	}
}; //---namespace unitfleet
