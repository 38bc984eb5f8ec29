#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Ledger.h"

#include <core/Array.h>
#include <core/Result.h>
#include <core/String.h>

namespace kakeibo
{
	struct ImportReport
	{
		int64_t successCount = 0;
		int64_t errorCount = 0;
		// the first ten row errors, "行N: ..."
		core::Array<core::String> details;

		explicit ImportReport(core::Allocator* allocator)
			: details(allocator)
		{}
	};

	static constexpr size_t IMPORT_REPORT_MAX_DETAILS = 10;

	struct MonthlyExportFiles
	{
		core::String summaryPath;
		core::String subjectsPath;
		core::String detailPath;
	};

	// id,date,category,subject,amount
	KAKEIBO_EXPORT core::HumanError writeEntriesCsv(const core::Array<Entry>& entries, core::StringView path, core::Allocator* allocator);

	// exports every active entry, returns the exported count, an empty ledger is an error
	KAKEIBO_EXPORT core::Result<size_t> exportEntries(Ledger& ledger, core::StringView path);

	// the file must be utf-8 with a header naming date, category, subject and amount in any order,
	// invalid rows are reported and skipped, valid rows are inserted in one transaction
	KAKEIBO_EXPORT core::Result<ImportReport> importEntries(Ledger& ledger, core::StringView path);
	KAKEIBO_EXPORT core::String importReportText(const ImportReport& report, core::Allocator* allocator);

	// writes <stem>_基本統計.csv, <stem>_科目別集計.csv and <stem>_詳細データ.csv
	KAKEIBO_EXPORT core::Result<MonthlyExportFiles> exportMonthlyStatistics(Ledger& ledger, Month month, core::StringView path);

	// one row per month with data, returns the written row count, no data at all is an error
	KAKEIBO_EXPORT core::Result<size_t> exportMonthComparison(Ledger& ledger, const core::Array<Month>& months, core::StringView path);
}
