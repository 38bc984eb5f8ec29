#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Ledger.h"

#include <core/Array.h>
#include <core/Result.h>
#include <core/String.h>

namespace kakeibo
{
	struct CleanupReport
	{
		core::Array<Month> archivedMonths;
		// months whose backup or archive failed, they stay active
		core::Array<Month> failedMonths;
		core::Array<core::String> backupPaths;
		int64_t archivedEntries = 0;

		explicit CleanupReport(core::Allocator* allocator)
			: archivedMonths(allocator),
			  failedMonths(allocator),
			  backupPaths(allocator)
		{}
	};

	// copies the ledger's file into destDir/kakeibo_backup_YYYYMMDD_HHMMSS.db and returns the new path
	KAKEIBO_EXPORT core::Result<core::String> backupDatabase(Ledger& ledger, core::StringView destDir, const DateTime& now);

	// writes the month's entries into destDir/kakeibo_monthly_YYYYMM_YYYYMMDD_HHMMSS.csv
	KAKEIBO_EXPORT core::Result<core::String> backupMonth(Ledger& ledger, Month month, core::StringView destDir, const DateTime& now);

	// keeps the newest monthsToKeep active months, every older month is backed up then archived
	KAKEIBO_EXPORT core::Result<CleanupReport> cleanupOldData(Ledger& ledger, int monthsToKeep, core::StringView destDir, const DateTime& now);
	KAKEIBO_EXPORT core::String cleanupReportText(const CleanupReport& report, core::Allocator* allocator);
}
