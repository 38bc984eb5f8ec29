#include "Fixture.h"

#include <core/Mallocator.h>

#include <kakeibo/Backup.h>
#include <kakeibo/Csv.h>

using namespace std::chrono;

namespace
{
	const kakeibo::DateTime NOW{
		.date = kakeibo::Date{year{2024}, month{6}, day{30}},
		.hour = 21,
		.minute = 5,
		.second = 9,
	};

	void add(kakeibo::Ledger& ledger, int y, unsigned m, double amount)
	{
		auto res = ledger.addEntry(kakeibo::NewEntry{
			.date = kakeibo::Date{year{y}, month{m}, day{15}},
			.category = kakeibo::CATEGORY_EXPENSE,
			.subject = core::String{"食費"_sv, ledger.allocator()},
			.amount = amount,
		});
		REQUIRE(res.isError() == false);
	}
}

TEST_CASE("kakeibo::backupDatabase")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	add(ledger, 2024, 6, 500);

	auto backupDir = dir.file("backups"_sv);
	auto expected = core::Path::join(&allocator, backupDir, "kakeibo_backup_20240630_210509.db"_sv);
	dir.track(expected);

	auto res = kakeibo::backupDatabase(ledger, backupDir, NOW);
	REQUIRE(res.isError() == false);
	REQUIRE(res.value() == expected);
	REQUIRE(core::File::exists(expected, &allocator));

	// the copy is a working ledger
	auto copy = kakeibo::Ledger::open(expected, &log, &allocator).releaseValue();
	REQUIRE(copy.entries().value().count() == 1);

	// the same stamp twice does not overwrite
	REQUIRE(kakeibo::backupDatabase(ledger, backupDir, NOW).isError());
}

TEST_CASE("kakeibo::backupDatabase without a file")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto path = dir.file("kakeibo.db"_sv);
	auto ledger = kakeibo::Ledger::open(path, &log, &allocator).releaseValue();
	REQUIRE(!core::File::remove(path, &allocator));

	auto res = kakeibo::backupDatabase(ledger, dir.path(), NOW);
	REQUIRE(res.isError());
	REQUIRE(res.error().message().startsWith("データベースファイルが見つかりません"_sv));
}

TEST_CASE("kakeibo::backupMonth")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	add(ledger, 2024, 3, 500);
	add(ledger, 2024, 3, 700);
	add(ledger, 2024, 4, 900);

	auto expected = dir.file("kakeibo_monthly_202403_20240630_210509.csv"_sv);
	auto res = kakeibo::backupMonth(ledger, kakeibo::Month{year{2024}, month{3}}, dir.path(), NOW);
	REQUIRE(res.isError() == false);
	REQUIRE(res.value() == expected);

	auto content = core::File::content(expected, &allocator);
	REQUIRE(content.isError() == false);
	auto rows = kakeibo::parseCsv(content.value(), &allocator).releaseValue();
	REQUIRE(rows.count() == 3);
	REQUIRE(rows[1][4] == "500"_sv);
	REQUIRE(rows[2][4] == "700"_sv);

	// backing up leaves the ledger alone
	REQUIRE(ledger.entries().value().count() == 3);

	auto empty = kakeibo::backupMonth(ledger, kakeibo::Month{year{2024}, month{5}}, dir.path(), NOW);
	REQUIRE(empty.isError());
	REQUIRE(empty.error().message() == "2024-05のデータがありません"_sv);
}

TEST_CASE("kakeibo::cleanupOldData")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	add(ledger, 2023, 11, 100);
	add(ledger, 2023, 12, 200);
	add(ledger, 2023, 12, 250);
	add(ledger, 2024, 1, 300);
	add(ledger, 2024, 2, 400);

	SUBCASE("keeps the newest months")
	{
		auto backupDir = dir.file("backups"_sv);
		dir.file("backups/kakeibo_monthly_202312_20240630_210509.csv"_sv);
		dir.file("backups/kakeibo_monthly_202311_20240630_210509.csv"_sv);

		auto res = kakeibo::cleanupOldData(ledger, 2, backupDir, NOW);
		REQUIRE(res.isError() == false);
		auto report = res.releaseValue();

		REQUIRE(report.archivedMonths.count() == 2);
		REQUIRE(report.archivedMonths[0] == kakeibo::Month{year{2023}, month{12}});
		REQUIRE(report.archivedMonths[1] == kakeibo::Month{year{2023}, month{11}});
		REQUIRE(report.archivedEntries == 3);
		REQUIRE(report.failedMonths.count() == 0);
		REQUIRE(report.backupPaths.count() == 2);
		for (const auto& path: report.backupPaths)
			REQUIRE(core::File::exists(path, &allocator));

		auto active = ledger.activeMonths().releaseValue();
		REQUIRE(active.count() == 2);
		REQUIRE(active[1] == kakeibo::Month{year{2024}, month{1}});
		REQUIRE(ledger.availableMonths().value().count() == 4);

		auto text = kakeibo::cleanupReportText(report, &allocator);
		REQUIRE(text == "クリーンアップ完了\nアーカイブした月: 2ヶ月\nアーカイブした件数: 3件\n  2023-12\n  2023-11"_sv);

		// nothing left to clean
		auto again = kakeibo::cleanupOldData(ledger, 2, backupDir, NOW).releaseValue();
		REQUIRE(again.archivedMonths.count() == 0);
		REQUIRE(kakeibo::cleanupReportText(again, &allocator) == "クリーンアップ対象のデータはありません"_sv);
	}

	SUBCASE("failed backups are not archived")
	{
		// a file where the backup directory should be
		auto blocked = dir.file("blocked"_sv);
		REQUIRE(!core::File::write(blocked, "x"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));

		auto report = kakeibo::cleanupOldData(ledger, 3, blocked, NOW).releaseValue();
		REQUIRE(report.archivedMonths.count() == 0);
		REQUIRE(report.failedMonths.count() == 1);
		REQUIRE(report.failedMonths[0] == kakeibo::Month{year{2023}, month{11}});
		REQUIRE(ledger.activeMonths().value().count() == 4);

		auto text = kakeibo::cleanupReportText(report, &allocator);
		REQUIRE(text.endsWith("\n失敗した月:\n  2023-11"_sv));
	}

	SUBCASE("keeping more months than exist")
	{
		auto report = kakeibo::cleanupOldData(ledger, 12, dir.path(), NOW).releaseValue();
		REQUIRE(report.archivedMonths.count() == 0);
		REQUIRE(report.failedMonths.count() == 0);
	}

	SUBCASE("invalid count")
	{
		REQUIRE(kakeibo::cleanupOldData(ledger, 0, dir.path(), NOW).isError());
	}
}
