#include "kakeibo/Config.h"

#include <core/Path.h>

#include <charconv>

namespace kakeibo
{
	namespace
	{
		core::HumanError applyReminder(Config& config, core::StringView value, core::Allocator* allocator)
		{
			if (value == "off"_sv)
			{
				config.reminderEnabled = false;
				return {};
			}

			auto timeResult = parseTimeOfDay(value, allocator);
			if (timeResult.isError())
				return timeResult.releaseError();

			config.reminderEnabled = true;
			config.reminderAt = timeResult.releaseValue();
			return {};
		}

		core::HumanError applyMonthsToKeep(Config& config, core::StringView value, core::Allocator* allocator)
		{
			int months = 0;
			auto res = std::from_chars(value.begin(), value.end(), months);
			if (res.ec != std::errc() || res.ptr != value.end())
				return core::errf(allocator, "保持月数は整数で指定してください: '{}'"_sv, value);

			if (months < Config::MIN_MONTHS_TO_KEEP || months > Config::MAX_MONTHS_TO_KEEP)
			{
				return core::errf(
					allocator,
					"保持月数は{}から{}の範囲で指定してください: {}"_sv,
					Config::MIN_MONTHS_TO_KEEP,
					Config::MAX_MONTHS_TO_KEEP,
					months
				);
			}

			config.monthsToKeep = months;
			return {};
		}
	}

	Config Config::defaults(core::StringView appDir, core::Allocator* allocator)
	{
		Config res{allocator};
		res.dbPath = core::Path::join(allocator, appDir, "kakeibo.db"_sv);
		res.logPath = core::Path::join(allocator, appDir, "kakeibo.log"_sv);
		res.backupDir = core::Path::clean(appDir, allocator);
		return res;
	}

	core::HumanError Config::applyEnvironment(core::Func<core::String(core::StringView)> lookup)
	{
		auto allocator = dbPath.allocator();

		if (auto value = lookup("KAKEIBO_DB"_sv); value.count() > 0)
			dbPath = std::move(value);
		if (auto value = lookup("KAKEIBO_LOG"_sv); value.count() > 0)
			logPath = std::move(value);
		if (auto value = lookup("KAKEIBO_BACKUP_DIR"_sv); value.count() > 0)
			backupDir = std::move(value);
		if (auto value = lookup("KAKEIBO_REMINDER"_sv); value.count() > 0)
		{
			if (auto err = applyReminder(*this, core::StringView{value}.trim(), allocator))
				return core::errf(allocator, "KAKEIBO_REMINDER: {}"_sv, err);
		}
		return {};
	}

	core::HumanError Config::applyArgs(const Args& args)
	{
		auto allocator = dbPath.allocator();

		if (args.hasOption("db"_sv))
			dbPath = core::String{args.option("db"_sv), allocator};
		if (args.hasOption("log"_sv))
			logPath = core::String{args.option("log"_sv), allocator};
		if (args.hasOption("backup-dir"_sv))
			backupDir = core::String{args.option("backup-dir"_sv), allocator};
		if (args.hasOption("reminder"_sv))
		{
			if (auto err = applyReminder(*this, args.option("reminder"_sv), allocator))
				return core::errf(allocator, "--reminder: {}"_sv, err);
		}
		if (args.hasOption("keep"_sv))
		{
			if (auto err = applyMonthsToKeep(*this, args.option("keep"_sv), allocator))
				return core::errf(allocator, "--keep: {}"_sv, err);
		}
		return {};
	}

	core::Result<Config> Config::load(const Args& args, core::Allocator* allocator)
	{
		auto appDirResult = core::Path::executableDir(allocator);
		if (appDirResult.isError())
			return appDirResult.releaseError();

		auto res = defaults(appDirResult.value(), allocator);
		if (auto err = res.applyEnvironment([allocator](core::StringView name) { return core::Path::env(name, allocator); }))
			return err;
		if (auto err = res.applyArgs(args))
			return err;
		return res;
	}
}
