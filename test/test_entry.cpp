#include <doctest/doctest.h>

#include <core/Mallocator.h>

#include <kakeibo/Entry.h>

TEST_CASE("kakeibo::parseCategory")
{
	core::Mallocator allocator;

	REQUIRE(kakeibo::parseCategory("収入"_sv, &allocator).value() == kakeibo::CATEGORY_INCOME);
	REQUIRE(kakeibo::parseCategory(" 支出 "_sv, &allocator).value() == kakeibo::CATEGORY_EXPENSE);
	REQUIRE(kakeibo::parseCategory("income"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseCategory(""_sv, &allocator).isError());

	REQUIRE(kakeibo::categoryName(kakeibo::CATEGORY_INCOME) == "収入"_sv);
	REQUIRE(kakeibo::categoryName(kakeibo::CATEGORY_EXPENSE) == "支出"_sv);
}

TEST_CASE("kakeibo::parseAmount")
{
	core::Mallocator allocator;

	REQUIRE(kakeibo::parseAmount("1500"_sv, &allocator).value() == 1500.0);
	REQUIRE(kakeibo::parseAmount(" 1234.5 "_sv, &allocator).value() == 1234.5);
	REQUIRE(kakeibo::parseAmount("0"_sv, &allocator).value() == 0.0);
	REQUIRE(kakeibo::parseAmount("+250"_sv, &allocator).value() == 250.0);
	REQUIRE(kakeibo::parseAmount("1.5e3"_sv, &allocator).value() == 1500.0);

	REQUIRE(kakeibo::parseAmount(""_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("abc"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("12abc"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("1,500"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("-1"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("nan"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("inf"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("1e400"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("0x10"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("0X1p4"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("+-5"_sv, &allocator).isError());
	REQUIRE(kakeibo::parseAmount("+"_sv, &allocator).isError());
}

TEST_CASE("kakeibo::parseSubject")
{
	core::Mallocator allocator;

	REQUIRE(kakeibo::parseSubject("  食費 "_sv, &allocator).value() == "食費"_sv);
	REQUIRE(kakeibo::parseSubject("   "_sv, &allocator).isError());

	const char latin1[] = {'c', 'a', 'f', '\xE9'};
	REQUIRE(kakeibo::parseSubject(core::StringView{latin1, sizeof(latin1)}, &allocator).isError());
}

TEST_CASE("kakeibo::parseEntry")
{
	core::Mallocator allocator;

	auto entryResult = kakeibo::parseEntry("令和6年1月15日"_sv, "支出"_sv, "食費"_sv, "1500"_sv, &allocator);
	REQUIRE(entryResult.isError() == false);
	const auto& entry = entryResult.value();
	REQUIRE(entry.date == kakeibo::Date{std::chrono::year{2024}, std::chrono::month{1}, std::chrono::day{15}});
	REQUIRE(entry.category == kakeibo::CATEGORY_EXPENSE);
	REQUIRE(entry.subject == "食費"_sv);
	REQUIRE(entry.amount == 1500.0);

	auto badDate = kakeibo::parseEntry("2024-02-30"_sv, "支出"_sv, "食費"_sv, "1500"_sv, &allocator);
	REQUIRE(badDate.isError());

	auto badAmount = kakeibo::parseEntry("2024-01-15"_sv, "支出"_sv, "食費"_sv, "千五百"_sv, &allocator);
	REQUIRE(badAmount.isError());
	REQUIRE(badAmount.error().message().startsWith("金額は数値で入力してください"_sv));
}

TEST_CASE("kakeibo::parseColumn")
{
	core::Mallocator allocator;

	REQUIRE(kakeibo::parseColumn("date"_sv, &allocator).value() == kakeibo::COLUMN_DATE);
	REQUIRE(kakeibo::parseColumn("category"_sv, &allocator).value() == kakeibo::COLUMN_CATEGORY);
	REQUIRE(kakeibo::parseColumn("subject"_sv, &allocator).value() == kakeibo::COLUMN_SUBJECT);
	REQUIRE(kakeibo::parseColumn("amount"_sv, &allocator).value() == kakeibo::COLUMN_AMOUNT);
	REQUIRE(kakeibo::parseColumn("id"_sv, &allocator).isError());
}
