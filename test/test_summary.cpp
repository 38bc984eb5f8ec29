#include <core/Mallocator.h>

#include <kakeibo/Summary.h>

#include <doctest/doctest.h>

using namespace std::chrono;

TEST_CASE("kakeibo::formatAmount")
{
	core::Mallocator allocator;

	REQUIRE(kakeibo::formatAmount(0, &allocator) == "0"_sv);
	REQUIRE(kakeibo::formatAmount(999, &allocator) == "999"_sv);
	REQUIRE(kakeibo::formatAmount(1000, &allocator) == "1,000"_sv);
	REQUIRE(kakeibo::formatAmount(1234567.4, &allocator) == "1,234,567"_sv);
	REQUIRE(kakeibo::formatAmount(1234567.6, &allocator) == "1,234,568"_sv);
	REQUIRE(kakeibo::formatAmount(-84000, &allocator) == "-84,000"_sv);
	REQUIRE(kakeibo::formatAmount(-0.2, &allocator) == "0"_sv);
	REQUIRE(kakeibo::formatAmount(100000000, &allocator) == "100,000,000"_sv);
}

TEST_CASE("kakeibo::summaryText")
{
	core::Mallocator allocator;

	kakeibo::MonthlySummary summary{
		.month = kakeibo::Month{year{2024}, month{1}},
		.income = 250000,
		.expense = 84000,
		.count = 4,
	};

	auto text = kakeibo::summaryText(summary, &allocator);
	REQUIRE(text ==
		"【2024-01の集計結果】\n"
		"収入合計: 250,000\n"
		"支出合計: 84,000\n"
		"差引残高: 166,000\n"
		"件数: 4件"_sv);

	summary.income = 0;
	text = kakeibo::summaryText(summary, &allocator);
	REQUIRE(text.find("差引残高: -84,000"_sv) != SIZE_MAX);
}

TEST_CASE("kakeibo::statisticsText")
{
	core::Mallocator allocator;

	kakeibo::MonthlyStatistics stats{&allocator};
	stats.month = kakeibo::Month{year{2024}, month{2}};
	stats.totalCount = 2;
	stats.expenseCount = 2;
	stats.expenseTotal = 3000;
	stats.averageExpense = 1500;
	stats.maxExpense = 2000;
	stats.minExpense = 1000;

	auto text = kakeibo::statisticsText(stats, &allocator);
	REQUIRE(text.startsWith("【2024-02の詳細統計】\n"_sv));
	REQUIRE(text.find("• 総レコード数: 2件\n"_sv) != SIZE_MAX);
	REQUIRE(text.find("• 収入件数: 0件\n"_sv) != SIZE_MAX);
	REQUIRE(text.find("• 差引残高: ¥-3,000\n"_sv) != SIZE_MAX);
	REQUIRE(text.find("• 最大支出: ¥2,000\n"_sv) != SIZE_MAX);
	REQUIRE(text.find("• 最小収入: ¥0\n"_sv) != SIZE_MAX);
	REQUIRE(text.find("科目別集計"_sv) == SIZE_MAX);

	stats.subjects.push(kakeibo::SubjectTotal{
		.category = kakeibo::CATEGORY_EXPENSE,
		.subject = core::String{"食費"_sv, &allocator},
		.amount = 3000,
	});
	text = kakeibo::statisticsText(stats, &allocator);
	REQUIRE(text.endsWith("\n科目別集計:\n• 支出 食費: ¥3,000\n"_sv));
}
