#include "kakeibo/Backup.h"
#include "kakeibo/Exchange.h"

#include <core/File.h>
#include <core/Path.h>

namespace kakeibo
{
	core::Result<core::String> backupDatabase(Ledger& ledger, core::StringView destDir, const DateTime& now)
	{
		auto allocator = ledger.allocator();

		if (core::File::exists(ledger.path(), allocator) == false)
			return core::errf(allocator, "データベースファイルが見つかりません: {}"_sv, ledger.path());

		if (auto err = core::File::createDirectories(destDir, allocator))
			return err;

		auto name = core::strf(allocator, "kakeibo_backup_{}.db"_sv, formatStamp(now, allocator));
		auto path = core::Path::join(allocator, destDir, name);
		if (auto err = core::File::copy(ledger.path(), path, allocator))
		{
			ledger.log()->error("バックアップ失敗: {}"_sv, err);
			return err;
		}

		ledger.log()->info("バックアップ作成: {}"_sv, path);
		return path;
	}

	core::Result<core::String> backupMonth(Ledger& ledger, Month month, core::StringView destDir, const DateTime& now)
	{
		auto allocator = ledger.allocator();

		auto entriesResult = ledger.entriesOfMonth(month);
		if (entriesResult.isError())
			return entriesResult.releaseError();
		auto entries = entriesResult.releaseValue();

		if (entries.count() == 0)
			return core::errf(allocator, "{}のデータがありません"_sv, formatMonth(month, allocator));

		if (auto err = core::File::createDirectories(destDir, allocator))
			return err;

		auto name = core::strf(
			allocator,
			"kakeibo_monthly_{:04}{:02}_{}.csv"_sv,
			int(month.year()),
			unsigned(month.month()),
			formatStamp(now, allocator)
		);
		auto path = core::Path::join(allocator, destDir, name);
		if (auto err = writeEntriesCsv(entries, path, allocator))
			return err;

		ledger.log()->info("月別バックアップ作成: {} ({}件)"_sv, path, entries.count());
		return path;
	}

	core::Result<CleanupReport> cleanupOldData(Ledger& ledger, int monthsToKeep, core::StringView destDir, const DateTime& now)
	{
		auto allocator = ledger.allocator();
		auto log = ledger.log();

		if (monthsToKeep < 1)
			return core::errf(allocator, "保持月数は1以上を指定してください: {}"_sv, monthsToKeep);

		auto monthsResult = ledger.activeMonths();
		if (monthsResult.isError())
			return monthsResult.releaseError();
		auto months = monthsResult.releaseValue();

		CleanupReport report{allocator};
		for (size_t i = (size_t)monthsToKeep; i < months.count(); ++i)
		{
			auto month = months[i];

			auto backupResult = backupMonth(ledger, month, destDir, now);
			if (backupResult.isError())
			{
				log->error("{}のバックアップに失敗したためアーカイブしません: {}"_sv, formatMonth(month, allocator), backupResult.error());
				report.failedMonths.push(month);
				continue;
			}

			auto archiveResult = ledger.archiveMonth(month, now.date);
			if (archiveResult.isError())
			{
				log->error("{}のアーカイブに失敗しました: {}"_sv, formatMonth(month, allocator), archiveResult.error());
				report.failedMonths.push(month);
				continue;
			}

			report.backupPaths.push(backupResult.releaseValue());
			report.archivedMonths.push(month);
			report.archivedEntries += archiveResult.value();
		}

		log->info(
			"自動クリーンアップ完了: アーカイブ{}ヶ月 ({}件), 失敗{}ヶ月"_sv,
			report.archivedMonths.count(),
			report.archivedEntries,
			report.failedMonths.count()
		);
		return report;
	}

	core::String cleanupReportText(const CleanupReport& report, core::Allocator* allocator)
	{
		if (report.archivedMonths.count() == 0 && report.failedMonths.count() == 0)
			return core::String{"クリーンアップ対象のデータはありません"_sv, allocator};

		auto res = core::strf(
			allocator,
			"クリーンアップ完了\nアーカイブした月: {}ヶ月\nアーカイブした件数: {}件"_sv,
			report.archivedMonths.count(),
			report.archivedEntries
		);
		for (auto month: report.archivedMonths)
			res.push(core::strf(allocator, "\n  {}"_sv, formatMonth(month, allocator)));

		if (report.failedMonths.count() > 0)
		{
			res.push("\n失敗した月:"_sv);
			for (auto month: report.failedMonths)
				res.push(core::strf(allocator, "\n  {}"_sv, formatMonth(month, allocator)));
		}
		return res;
	}
}
