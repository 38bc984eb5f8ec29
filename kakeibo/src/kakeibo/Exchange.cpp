#include "kakeibo/Exchange.h"
#include "kakeibo/Csv.h"

#include <core/Encoding.h>
#include <core/File.h>
#include <core/Path.h>

#include <cstdint>

namespace kakeibo
{
	namespace
	{
		core::String number(double value, core::Allocator* allocator)
		{
			return core::strf(allocator, "{}"_sv, value);
		}

		core::String number(int64_t value, core::Allocator* allocator)
		{
			return core::strf(allocator, "{}"_sv, value);
		}

		core::StringView fieldAt(const CsvRow& row, size_t index)
		{
			if (index < row.count())
				return row[index];
			return {};
		}
	}

	core::HumanError writeEntriesCsv(const core::Array<Entry>& entries, core::StringView path, core::Allocator* allocator)
	{
		CsvWriter csv{allocator};
		csv.row({"id"_sv, "date"_sv, "category"_sv, "subject"_sv, "amount"_sv});
		for (const auto& entry: entries)
		{
			csv.row({
				number(entry.id, allocator),
				formatDate(entry.date, allocator),
				categoryName(entry.category),
				entry.subject,
				number(entry.amount, allocator),
			});
		}
		return csv.save(path);
	}

	core::Result<size_t> exportEntries(Ledger& ledger, core::StringView path)
	{
		auto allocator = ledger.allocator();

		auto entriesResult = ledger.entries();
		if (entriesResult.isError())
			return entriesResult.releaseError();
		auto entries = entriesResult.releaseValue();

		if (entries.count() == 0)
			return core::errf(allocator, "エクスポートするデータがありません"_sv);

		if (auto err = writeEntriesCsv(entries, path, allocator))
			return err;

		ledger.log()->info("CSVエクスポート成功: {}, 件数: {}"_sv, path, entries.count());
		return entries.count();
	}

	core::Result<ImportReport> importEntries(Ledger& ledger, core::StringView path)
	{
		auto allocator = ledger.allocator();
		auto log = ledger.log();

		log->info("CSVインポート開始: {}"_sv, path);

		auto contentResult = core::File::content(path, allocator);
		if (contentResult.isError())
			return contentResult.releaseError();
		auto content = contentResult.releaseValue();

		// files saved by excel on japanese windows are cp932
		if (core::StringView{content}.isValidUtf8() == false)
		{
			auto convertedResult = core::cp932ToUtf8(content, allocator);
			if (convertedResult.isError())
			{
				log->warn("{}"_sv, convertedResult.error());
				return core::errf(allocator, "CSVファイルの文字コードを判別できません (UTF-8またはShift_JISで保存してください): {}"_sv, path);
			}
			content = convertedResult.releaseValue();
			if (core::StringView{content}.isValidUtf8() == false)
				return core::errf(allocator, "CSVファイルの文字コードを判別できません (UTF-8またはShift_JISで保存してください): {}"_sv, path);
			log->info("エンコーディング検出: CP932"_sv);
		}

		auto rowsResult = parseCsv(content, allocator);
		if (rowsResult.isError())
			return core::errf(allocator, "CSVファイルの形式が正しくありません: {}"_sv, rowsResult.error());
		auto rows = rowsResult.releaseValue();

		if (rows.count() == 0)
			return core::errf(allocator, "CSVファイルが空です: {}"_sv, path);

		constexpr size_t MISSING = SIZE_MAX;
		size_t columns[] = {MISSING, MISSING, MISSING, MISSING};
		const COLUMN required[] = {COLUMN_DATE, COLUMN_CATEGORY, COLUMN_SUBJECT, COLUMN_AMOUNT};

		const auto& header = rows[0];
		for (size_t i = 0; i < header.count(); ++i)
		{
			auto name = core::StringView{header[i]}.trim();
			for (auto column: required)
			{
				if (name == columnName(column) && columns[column] == MISSING)
					columns[column] = i;
			}
		}

		core::String missing{allocator};
		for (auto column: required)
		{
			if (columns[column] != MISSING)
				continue;
			if (missing.count() > 0)
				missing.push(", "_sv);
			missing.push(columnName(column));
		}
		if (missing.count() > 0)
			return core::errf(allocator, "必要な列が不足しています: {}"_sv, missing);

		ImportReport report{allocator};
		core::Array<NewEntry> entries{allocator};

		auto addError = [&](core::String detail) {
			++report.errorCount;
			if (report.details.count() < IMPORT_REPORT_MAX_DETAILS)
				report.details.push(std::move(detail));
		};

		for (size_t i = 1; i < rows.count(); ++i)
		{
			const auto& row = rows[i];
			auto dateText = fieldAt(row, columns[COLUMN_DATE]);
			auto categoryText = fieldAt(row, columns[COLUMN_CATEGORY]);
			auto subjectText = fieldAt(row, columns[COLUMN_SUBJECT]);
			auto amountText = fieldAt(row, columns[COLUMN_AMOUNT]);

			auto dateResult = parseDate(dateText, allocator);
			if (dateResult.isError())
			{
				addError(core::strf(allocator, "行{}: 日付形式エラー - {}"_sv, i, dateText));
				continue;
			}

			auto amountResult = parseAmount(amountText, allocator);
			if (amountResult.isError())
			{
				addError(core::strf(allocator, "行{}: 金額形式エラー - {}"_sv, i, amountText));
				continue;
			}

			auto categoryResult = parseCategory(categoryText, allocator);
			if (categoryResult.isError())
			{
				addError(core::strf(allocator, "行{}: 区分エラー - {}"_sv, i, categoryText));
				continue;
			}

			auto subjectResult = parseSubject(subjectText, allocator);
			if (subjectResult.isError())
			{
				addError(core::strf(allocator, "行{}: 科目エラー - {}"_sv, i, subjectResult.error()));
				continue;
			}

			entries.push(NewEntry{
				.date = dateResult.releaseValue(),
				.category = categoryResult.releaseValue(),
				.subject = subjectResult.releaseValue(),
				.amount = amountResult.releaseValue(),
			});
		}

		if (auto err = ledger.insertEntries(entries))
			return err;
		report.successCount = (int64_t)entries.count();

		if (report.errorCount > 0)
			log->warn("CSVインポート完了: 成功{}件, エラー{}件"_sv, report.successCount, report.errorCount);
		else
			log->info("CSVインポート完了: 成功{}件, エラー{}件"_sv, report.successCount, report.errorCount);
		return report;
	}

	core::String importReportText(const ImportReport& report, core::Allocator* allocator)
	{
		auto res = core::strf(allocator, "インポート完了\n成功: {}件\nエラー: {}件"_sv, report.successCount, report.errorCount);
		if (report.details.count() > 0)
		{
			res.push("\n\nエラー詳細:"_sv);
			for (const auto& detail: report.details)
			{
				res.pushByte('\n');
				res.push(detail);
			}

			auto rest = report.errorCount - (int64_t)report.details.count();
			if (rest > 0)
				res.push(core::strf(allocator, "\n... 他{}件"_sv, rest));
		}
		return res;
	}

	core::Result<MonthlyExportFiles> exportMonthlyStatistics(Ledger& ledger, Month month, core::StringView path)
	{
		auto allocator = ledger.allocator();
		auto monthText = formatMonth(month, allocator);

		auto statsResult = ledger.monthlyStatistics(month);
		if (statsResult.isError())
			return statsResult.releaseError();
		auto stats = statsResult.releaseValue();
		if (stats.has_value() == false)
			return core::errf(allocator, "{}のデータがありません"_sv, monthText);

		auto entriesResult = ledger.entriesOfMonth(month);
		if (entriesResult.isError())
			return entriesResult.releaseError();
		auto entries = entriesResult.releaseValue();

		auto stem = core::Path::withoutExtension(path);
		MonthlyExportFiles files{
			.summaryPath = core::strf(allocator, "{}_基本統計.csv"_sv, stem),
			.subjectsPath = core::strf(allocator, "{}_科目別集計.csv"_sv, stem),
			.detailPath = core::strf(allocator, "{}_詳細データ.csv"_sv, stem),
		};

		CsvWriter summary{allocator};
		summary.row({"項目"_sv, "値"_sv, "備考"_sv});
		summary.row({"対象月"_sv, monthText, ""_sv});
		summary.row({"総レコード数"_sv, number(stats->totalCount, allocator), "件"_sv});
		summary.row({"収入総額"_sv, formatAmount(stats->incomeTotal, allocator), "円"_sv});
		summary.row({"支出総額"_sv, formatAmount(stats->expenseTotal, allocator), "円"_sv});
		summary.row({"差引残高"_sv, formatAmount(stats->balance(), allocator), "円"_sv});
		summary.row({"収入件数"_sv, number(stats->incomeCount, allocator), "件"_sv});
		summary.row({"支出件数"_sv, number(stats->expenseCount, allocator), "件"_sv});
		summary.row({"平均収入"_sv, formatAmount(stats->averageIncome, allocator), "円"_sv});
		summary.row({"平均支出"_sv, formatAmount(stats->averageExpense, allocator), "円"_sv});
		summary.row({"最大収入"_sv, formatAmount(stats->maxIncome, allocator), "円"_sv});
		summary.row({"最大支出"_sv, formatAmount(stats->maxExpense, allocator), "円"_sv});
		if (auto err = summary.save(files.summaryPath))
			return err;

		CsvWriter subjects{allocator};
		subjects.row({"区分"_sv, "科目"_sv, "金額"_sv, "金額（表示用）"_sv});
		for (const auto& subject: stats->subjects)
		{
			subjects.row({
				categoryName(subject.category),
				subject.subject,
				number(subject.amount, allocator),
				formatAmount(subject.amount, allocator),
			});
		}
		if (auto err = subjects.save(files.subjectsPath))
			return err;

		if (auto err = writeEntriesCsv(entries, files.detailPath, allocator))
			return err;

		ledger.log()->info("月別集計CSV出力成功: {}"_sv, monthText);
		return files;
	}

	core::Result<size_t> exportMonthComparison(Ledger& ledger, const core::Array<Month>& months, core::StringView path)
	{
		auto allocator = ledger.allocator();

		CsvWriter csv{allocator};
		csv.row({
			"月"_sv, "収入総額"_sv, "支出総額"_sv, "差引残高"_sv, "収入件数"_sv, "支出件数"_sv, "総レコード数"_sv,
			"平均収入"_sv, "平均支出"_sv, "最大収入"_sv, "最大支出"_sv,
			"収入総額（表示用）"_sv, "支出総額（表示用）"_sv, "差引残高（表示用）"_sv,
			"平均収入（表示用）"_sv, "平均支出（表示用）"_sv, "最大収入（表示用）"_sv, "最大支出（表示用）"_sv,
		});

		size_t count = 0;
		for (auto month: months)
		{
			auto statsResult = ledger.monthlyStatistics(month);
			if (statsResult.isError())
				return statsResult.releaseError();
			auto stats = statsResult.releaseValue();
			if (stats.has_value() == false)
				continue;

			csv.row({
				formatMonth(month, allocator),
				number(stats->incomeTotal, allocator),
				number(stats->expenseTotal, allocator),
				number(stats->balance(), allocator),
				number(stats->incomeCount, allocator),
				number(stats->expenseCount, allocator),
				number(stats->totalCount, allocator),
				number(stats->averageIncome, allocator),
				number(stats->averageExpense, allocator),
				number(stats->maxIncome, allocator),
				number(stats->maxExpense, allocator),
				formatAmount(stats->incomeTotal, allocator),
				formatAmount(stats->expenseTotal, allocator),
				formatAmount(stats->balance(), allocator),
				formatAmount(stats->averageIncome, allocator),
				formatAmount(stats->averageExpense, allocator),
				formatAmount(stats->maxIncome, allocator),
				formatAmount(stats->maxExpense, allocator),
			});
			++count;
		}

		if (count == 0)
			return core::errf(allocator, "有効なデータがありません"_sv);

		if (auto err = csv.save(path))
			return err;

		ledger.log()->info("複数月比較CSV出力成功: {}, {}ヶ月"_sv, path, count);
		return count;
	}
}
