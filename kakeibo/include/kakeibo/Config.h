#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Args.h"
#include "kakeibo/Date.h"

#include <core/Func.h>
#include <core/Result.h>
#include <core/String.h>

namespace kakeibo
{
	// runtime settings, resolved from built-in defaults, then the environment, then the command line
	struct Config
	{
		core::String dbPath;
		core::String logPath;
		core::String backupDir;
		bool reminderEnabled = true;
		TimeOfDay reminderAt;
		int monthsToKeep = 12;

		static constexpr int MIN_MONTHS_TO_KEEP = 1;
		static constexpr int MAX_MONTHS_TO_KEEP = 60;

		explicit Config(core::Allocator* allocator)
			: dbPath(allocator),
			  logPath(allocator),
			  backupDir(allocator)
		{}

		// kakeibo.db and kakeibo.log inside appDir, backups are written to appDir too
		KAKEIBO_EXPORT static Config defaults(core::StringView appDir, core::Allocator* allocator);

		// KAKEIBO_DB, KAKEIBO_LOG, KAKEIBO_BACKUP_DIR and KAKEIBO_REMINDER, lookup returns an empty string for unset variables
		KAKEIBO_EXPORT core::HumanError applyEnvironment(core::Func<core::String(core::StringView)> lookup);

		// --db, --log, --backup-dir, --reminder HH:MM|off and --keep N
		KAKEIBO_EXPORT core::HumanError applyArgs(const Args& args);

		// defaults next to the executable, then the process environment, then args
		KAKEIBO_EXPORT static core::Result<Config> load(const Args& args, core::Allocator* allocator);
	};
}
