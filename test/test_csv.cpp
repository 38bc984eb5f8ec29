#include "Fixture.h"

#include <core/Mallocator.h>

#include <kakeibo/Csv.h>

TEST_CASE("kakeibo::CsvWriter")
{
	core::Mallocator allocator;

	kakeibo::CsvWriter writer{&allocator};
	writer.row({"id"_sv, "subject"_sv, "amount"_sv});
	writer.row({"1"_sv, "食費, 外食"_sv, "1500"_sv});
	writer.row({"2"_sv, "say \"hi\""_sv, ""_sv});
	writer.row({"3"_sv, "two\nlines"_sv, "0"_sv});

	REQUIRE(writer.content() ==
		"\xEF\xBB\xBF"
		"id,subject,amount\r\n"
		"1,\"食費, 外食\",1500\r\n"
		"2,\"say \"\"hi\"\"\",\r\n"
		"3,\"two\nlines\",0\r\n"_sv);
}

TEST_CASE("kakeibo::CsvWriter save")
{
	core::Mallocator allocator;
	TempDir dir{&allocator};
	auto path = dir.file("out.csv"_sv);

	kakeibo::CsvWriter writer{&allocator};
	writer.row({"a"_sv, "b"_sv});
	REQUIRE(!writer.save(path));

	// saving again overwrites
	REQUIRE(!writer.save(path));

	auto content = core::File::content(path, &allocator);
	REQUIRE(content.isError() == false);
	REQUIRE(content.value() == writer.content());
}

TEST_CASE("kakeibo::parseCsv")
{
	core::Mallocator allocator;

	SUBCASE("plain rows")
	{
		auto rows = kakeibo::parseCsv("date,amount\n2024-01-01,100\r\n2024-01-02,200"_sv, &allocator).releaseValue();
		REQUIRE(rows.count() == 3);
		REQUIRE(rows[0].count() == 2);
		REQUIRE(rows[0][0] == "date"_sv);
		REQUIRE(rows[1][1] == "100"_sv);
		REQUIRE(rows[2][0] == "2024-01-02"_sv);
		REQUIRE(rows[2][1] == "200"_sv);
	}

	SUBCASE("bom is skipped")
	{
		auto rows = kakeibo::parseCsv("\xEF\xBB\xBF" "date\r\n"_sv, &allocator).releaseValue();
		REQUIRE(rows.count() == 1);
		REQUIRE(rows[0][0] == "date"_sv);
	}

	SUBCASE("quoted fields")
	{
		auto rows = kakeibo::parseCsv("\"a,b\",\"say \"\"hi\"\"\",\"two\r\nlines\"\n"_sv, &allocator).releaseValue();
		REQUIRE(rows.count() == 1);
		REQUIRE(rows[0].count() == 3);
		REQUIRE(rows[0][0] == "a,b"_sv);
		REQUIRE(rows[0][1] == "say \"hi\""_sv);
		REQUIRE(rows[0][2] == "two\r\nlines"_sv);
	}

	SUBCASE("blank lines are skipped but empty fields are kept")
	{
		auto rows = kakeibo::parseCsv("a\n\n\r\n,\n\"\"\n"_sv, &allocator).releaseValue();
		REQUIRE(rows.count() == 3);
		REQUIRE(rows[0][0] == "a"_sv);
		REQUIRE(rows[1].count() == 2);
		REQUIRE(rows[1][0].empty());
		REQUIRE(rows[2].count() == 1);
		REQUIRE(rows[2][0].empty());
	}

	SUBCASE("empty content")
	{
		auto rows = kakeibo::parseCsv(""_sv, &allocator).releaseValue();
		REQUIRE(rows.count() == 0);
	}

	SUBCASE("malformed quotes")
	{
		auto unterminated = kakeibo::parseCsv("a,b\n\"open\n"_sv, &allocator);
		REQUIRE(unterminated.isError());
		REQUIRE(unterminated.error().message() == "line 3: unterminated quoted field"_sv);

		auto stray = kakeibo::parseCsv("ab\"c\n"_sv, &allocator);
		REQUIRE(stray.isError());

		auto trailing = kakeibo::parseCsv("x,\"ab\"c\n"_sv, &allocator);
		REQUIRE(trailing.isError());
		REQUIRE(trailing.error().message() == "line 1: unexpected character after a closing quote"_sv);

		auto spaced = kakeibo::parseCsv("\"a\" ,b\n"_sv, &allocator);
		REQUIRE(spaced.isError());

		// a closing quote right before a separator or the end is fine
		auto closed = kakeibo::parseCsv("\"ab\",\"c\"\r\n\"d\""_sv, &allocator);
		REQUIRE(closed.isError() == false);
		REQUIRE(closed.value().count() == 2);
		REQUIRE(closed.value()[0][0] == "ab"_sv);
		REQUIRE(closed.value()[1][0] == "d"_sv);
	}
}
