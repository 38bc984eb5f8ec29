#include "Fixture.h"

#include <core/Mallocator.h>

#include <kakeibo/Csv.h>
#include <kakeibo/Exchange.h>

using namespace std::chrono;

namespace
{
	void add(kakeibo::Ledger& ledger, unsigned m, unsigned d, kakeibo::CATEGORY category, core::StringView subject, double amount)
	{
		auto res = ledger.addEntry(kakeibo::NewEntry{
			.date = kakeibo::Date{year{2024}, month{m}, day{d}},
			.category = category,
			.subject = core::String{subject, ledger.allocator()},
			.amount = amount,
		});
		REQUIRE(res.isError() == false);
	}

	core::Array<kakeibo::CsvRow> readCsv(core::StringView path, core::Allocator* allocator)
	{
		auto content = core::File::content(path, allocator);
		REQUIRE(content.isError() == false);
		auto rows = kakeibo::parseCsv(content.value(), allocator);
		REQUIRE(rows.isError() == false);
		return rows.releaseValue();
	}
}

TEST_CASE("kakeibo::exportEntries and importEntries")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto source = kakeibo::Ledger::open(dir.file("source.db"_sv), &log, &allocator).releaseValue();
	auto target = kakeibo::Ledger::open(dir.file("target.db"_sv), &log, &allocator).releaseValue();
	auto csvPath = dir.file("entries.csv"_sv);

	auto empty = kakeibo::exportEntries(source, csvPath);
	REQUIRE(empty.isError());
	REQUIRE(empty.error().message() == "エクスポートするデータがありません"_sv);

	add(source, 1, 5, kakeibo::CATEGORY_INCOME, "給与"_sv, 250000);
	add(source, 1, 10, kakeibo::CATEGORY_EXPENSE, "食費, 外食"_sv, 1500.5);

	auto exported = kakeibo::exportEntries(source, csvPath);
	REQUIRE(exported.isError() == false);
	REQUIRE(exported.value() == 2);

	auto rows = readCsv(csvPath, &allocator);
	REQUIRE(rows.count() == 3);
	REQUIRE(rows[0][0] == "id"_sv);
	REQUIRE(rows[0][4] == "amount"_sv);
	REQUIRE(rows[2][1] == "2024-01-10"_sv);
	REQUIRE(rows[2][2] == "支出"_sv);
	REQUIRE(rows[2][3] == "食費, 外食"_sv);
	REQUIRE(rows[2][4] == "1500.5"_sv);

	auto imported = kakeibo::importEntries(target, csvPath);
	REQUIRE(imported.isError() == false);
	REQUIRE(imported.value().successCount == 2);
	REQUIRE(imported.value().errorCount == 0);

	auto entries = target.entries().releaseValue();
	REQUIRE(entries.count() == 2);
	REQUIRE(entries[0].category == kakeibo::CATEGORY_INCOME);
	REQUIRE(entries[0].amount == 250000);
	REQUIRE(entries[1].subject == "食費, 外食"_sv);
	REQUIRE(entries[1].amount == 1500.5);

	REQUIRE(kakeibo::importReportText(imported.value(), &allocator) == "インポート完了\n成功: 2件\nエラー: 0件"_sv);
}

TEST_CASE("kakeibo::importEntries reports bad rows")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	auto csvPath = dir.file("import.csv"_sv);

	SUBCASE("row errors")
	{
		// columns in a different order with an extra one
		kakeibo::CsvWriter csv{&allocator};
		csv.row({"amount"_sv, "memo"_sv, "subject"_sv, "category"_sv, "date"_sv});
		csv.row({"1000"_sv, ""_sv, "食費"_sv, "支出"_sv, "2024/02/01"_sv});
		csv.row({"1000"_sv, ""_sv, "食費"_sv, "支出"_sv, "2024-13-01"_sv});
		csv.row({"abc"_sv, ""_sv, "食費"_sv, "支出"_sv, "2024-02-02"_sv});
		csv.row({"1000"_sv, ""_sv, "食費"_sv, "その他"_sv, "2024-02-03"_sv});
		csv.row({"1000"_sv, ""_sv, " "_sv, "支出"_sv, "2024-02-04"_sv});
		csv.row({"2500"_sv, ""_sv, "交通費"_sv, "支出"_sv, "令和6年2月5日"_sv});
		REQUIRE(!csv.save(csvPath));

		auto res = kakeibo::importEntries(ledger, csvPath);
		REQUIRE(res.isError() == false);
		auto report = res.releaseValue();
		REQUIRE(report.successCount == 2);
		REQUIRE(report.errorCount == 4);
		REQUIRE(report.details.count() == 4);
		REQUIRE(report.details[0] == "行2: 日付形式エラー - 2024-13-01"_sv);
		REQUIRE(report.details[1] == "行3: 金額形式エラー - abc"_sv);
		REQUIRE(report.details[2] == "行4: 区分エラー - その他"_sv);
		REQUIRE(report.details[3].startsWith("行5: 科目エラー - "_sv));

		auto entries = ledger.entries().releaseValue();
		REQUIRE(entries.count() == 2);
		REQUIRE(entries[1].subject == "交通費"_sv);
		REQUIRE(entries[1].amount == 2500);

		auto text = kakeibo::importReportText(report, &allocator);
		REQUIRE(text.startsWith("インポート完了\n成功: 2件\nエラー: 4件\n\nエラー詳細:\n行2: "_sv));
	}

	SUBCASE("details are capped")
	{
		kakeibo::CsvWriter csv{&allocator};
		csv.row({"date"_sv, "category"_sv, "subject"_sv, "amount"_sv});
		for (int i = 0; i < 12; ++i)
			csv.row({"bad"_sv, "支出"_sv, "食費"_sv, "100"_sv});
		REQUIRE(!csv.save(csvPath));

		auto report = kakeibo::importEntries(ledger, csvPath).releaseValue();
		REQUIRE(report.successCount == 0);
		REQUIRE(report.errorCount == 12);
		REQUIRE(report.details.count() == kakeibo::IMPORT_REPORT_MAX_DETAILS);

		auto text = kakeibo::importReportText(report, &allocator);
		REQUIRE(text.endsWith("\n... 他2件"_sv));
	}

	SUBCASE("missing columns")
	{
		REQUIRE(!core::File::write(csvPath, "category,subject\n支出,食費\n"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));
		auto res = kakeibo::importEntries(ledger, csvPath);
		REQUIRE(res.isError());
		REQUIRE(res.error().message() == "必要な列が不足しています: date, amount"_sv);
	}

	SUBCASE("shift_jis file")
	{
		// 支出 and 食費 as excel saves them on japanese windows
		REQUIRE(!core::File::write(csvPath, "date,category,subject,amount\n2024/01/07,\x8E\x78\x8F\x6F,\x90\x48\x94\xEF,1200\n"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));
		auto res = kakeibo::importEntries(ledger, csvPath);
		REQUIRE(res.isError() == false);
		REQUIRE(res.value().successCount == 1);

		auto entries = ledger.entries().releaseValue();
		REQUIRE(entries.count() == 1);
		REQUIRE(entries[0].category == kakeibo::CATEGORY_EXPENSE);
		REQUIRE(entries[0].subject == "食費"_sv);
		REQUIRE(entries[0].amount == 1200);
	}

	SUBCASE("unknown encoding")
	{
		// a shift_jis lead byte with nothing after it
		REQUIRE(!core::File::write(csvPath, "date,category,subject,amount\n2024-01-01,x,\x90"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));
		auto res = kakeibo::importEntries(ledger, csvPath);
		REQUIRE(res.isError());
		REQUIRE(res.error().message().startsWith("CSVファイルの文字コードを判別できません"_sv));
		REQUIRE(ledger.entries().value().count() == 0);
	}

	SUBCASE("missing file")
	{
		REQUIRE(kakeibo::importEntries(ledger, csvPath).isError());
	}
}

TEST_CASE("kakeibo::exportMonthlyStatistics")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	add(ledger, 3, 1, kakeibo::CATEGORY_INCOME, "給与"_sv, 300000);
	add(ledger, 3, 2, kakeibo::CATEGORY_EXPENSE, "家賃"_sv, 90000);
	add(ledger, 3, 3, kakeibo::CATEGORY_EXPENSE, "食費"_sv, 1234);

	auto march = kakeibo::Month{year{2024}, month{3}};

	dir.track(core::Path::join(&allocator, dir.path(), "stats_基本統計.csv"_sv));
	dir.track(core::Path::join(&allocator, dir.path(), "stats_科目別集計.csv"_sv));
	dir.track(core::Path::join(&allocator, dir.path(), "stats_詳細データ.csv"_sv));

	auto res = kakeibo::exportMonthlyStatistics(ledger, march, core::Path::join(&allocator, dir.path(), "stats.csv"_sv));
	REQUIRE(res.isError() == false);
	auto files = res.releaseValue();
	REQUIRE(files.summaryPath.endsWith("/stats_基本統計.csv"_sv));

	auto summary = readCsv(files.summaryPath, &allocator);
	REQUIRE(summary.count() == 12);
	REQUIRE(summary[1][0] == "対象月"_sv);
	REQUIRE(summary[1][1] == "2024-03"_sv);
	REQUIRE(summary[2][1] == "3"_sv);
	REQUIRE(summary[5][0] == "差引残高"_sv);
	REQUIRE(summary[5][1] == "208,766"_sv);
	REQUIRE(summary[5][2] == "円"_sv);

	auto subjects = readCsv(files.subjectsPath, &allocator);
	REQUIRE(subjects.count() == 4);
	REQUIRE(subjects[1][1] == "給与"_sv);
	REQUIRE(subjects[3][1] == "食費"_sv);
	REQUIRE(subjects[3][2] == "1234"_sv);
	REQUIRE(subjects[3][3] == "1,234"_sv);

	auto detail = readCsv(files.detailPath, &allocator);
	REQUIRE(detail.count() == 4);
	REQUIRE(detail[0][1] == "date"_sv);

	auto missing = kakeibo::exportMonthlyStatistics(ledger, kakeibo::Month{year{2024}, month{4}}, files.summaryPath);
	REQUIRE(missing.isError());
	REQUIRE(missing.error().message() == "2024-04のデータがありません"_sv);
}

TEST_CASE("kakeibo::exportMonthComparison")
{
	core::Mallocator allocator;
	auto log = nullLog(&allocator);
	TempDir dir{&allocator};

	auto ledger = kakeibo::Ledger::open(dir.file("kakeibo.db"_sv), &log, &allocator).releaseValue();
	add(ledger, 1, 1, kakeibo::CATEGORY_EXPENSE, "食費"_sv, 1000);
	add(ledger, 2, 1, kakeibo::CATEGORY_INCOME, "給与"_sv, 200000);
	add(ledger, 2, 2, kakeibo::CATEGORY_EXPENSE, "食費"_sv, 3000);

	auto csvPath = dir.file("compare.csv"_sv);

	core::Array<kakeibo::Month> months{&allocator};
	months.push(kakeibo::Month{year{2024}, month{2}});
	months.push(kakeibo::Month{year{2023}, month{7}});
	months.push(kakeibo::Month{year{2024}, month{1}});

	auto res = kakeibo::exportMonthComparison(ledger, months, csvPath);
	REQUIRE(res.isError() == false);
	REQUIRE(res.value() == 2);

	auto rows = readCsv(csvPath, &allocator);
	REQUIRE(rows.count() == 3);
	REQUIRE(rows[0].count() == 18);
	REQUIRE(rows[0][11] == "収入総額（表示用）"_sv);
	REQUIRE(rows[1][0] == "2024-02"_sv);
	REQUIRE(rows[1][1] == "200000"_sv);
	REQUIRE(rows[1][3] == "197000"_sv);
	REQUIRE(rows[1][13] == "197,000"_sv);
	REQUIRE(rows[2][0] == "2024-01"_sv);
	REQUIRE(rows[2][3] == "-1000"_sv);

	core::Array<kakeibo::Month> nothing{&allocator};
	nothing.push(kakeibo::Month{year{2020}, month{1}});
	auto none = kakeibo::exportMonthComparison(ledger, nothing, dir.file("none.csv"_sv));
	REQUIRE(none.isError());
	REQUIRE(none.error().message() == "有効なデータがありません"_sv);
}
