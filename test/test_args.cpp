#include <core/Mallocator.h>

#include <kakeibo/Args.h>

#include <doctest/doctest.h>

namespace
{
	template<size_t N>
	core::Result<kakeibo::Args> parse(const char* (&argv)[N], std::initializer_list<core::StringView> switches, core::Allocator* allocator)
	{
		return kakeibo::Args::parse(int(N), const_cast<char**>(argv), switches, allocator);
	}
}

TEST_CASE("kakeibo::Args parse")
{
	core::Mallocator allocator;

	const char* argv[] = {
		"kakeibo-cli",
		"ledger.db",
		"add",
		"-date", "2024-01-05",
		"--subject", " 食費 ",
		"--amount=1500",
		"--init-db",
		"-",
	};

	auto res = parse(argv, {"init-db"_sv}, &allocator);
	REQUIRE(res.isError() == false);
	auto args = res.releaseValue();

	REQUIRE(args.positionals().count() == 3);
	REQUIRE(args.positional(0) == "ledger.db"_sv);
	REQUIRE(args.positional(1) == "add"_sv);
	REQUIRE(args.positional(2) == "-"_sv);
	REQUIRE(args.positional(3).count() == 0);

	REQUIRE(args.hasOption("date"_sv));
	REQUIRE(args.option("date"_sv) == "2024-01-05"_sv);
	REQUIRE(args.option("subject"_sv) == "食費"_sv);
	REQUIRE(args.option("amount"_sv) == "1500"_sv);
	REQUIRE(args.hasOption("category"_sv) == false);
	REQUIRE(args.option("category"_sv).count() == 0);

	REQUIRE(args.hasSwitch("init-db"_sv));
	REQUIRE(args.hasOption("init-db"_sv) == false);
}

TEST_CASE("kakeibo::Args parse errors")
{
	core::Mallocator allocator;

	const char* missingValue[] = {"kakeibo-cli", "list", "-month"};
	auto res = parse(missingValue, {}, &allocator);
	REQUIRE(res.isError());
	REQUIRE(res.error().message() == "option 'month' has no value"_sv);

	const char* duplicate[] = {"kakeibo-cli", "-id", "1", "--id=2"};
	res = parse(duplicate, {}, &allocator);
	REQUIRE(res.isError());
	REQUIRE(res.error().message() == "option 'id' is already defined"_sv);

	const char* dashes[] = {"kakeibo-cli", "--"};
	REQUIRE(parse(dashes, {}, &allocator).isError());
}

TEST_CASE("kakeibo::Args loadOptions")
{
	core::Mallocator allocator;

	const char* argv[] = {"kakeibo-cli", "update", "-id", "3", "-column", "amount", "-value", "2000"};
	auto args = parse(argv, {}, &allocator).releaseValue();

	core::StringView id, column, value, note;
	REQUIRE(!args.loadOptions({
		{"id"_sv, id},
		{"column"_sv, column},
		{"value"_sv, value},
		{"note"_sv, note, false},
	}));
	REQUIRE(id == "3"_sv);
	REQUIRE(column == "amount"_sv);
	REQUIRE(value == "2000"_sv);
	REQUIRE(note.count() == 0);

	auto err = args.loadOptions({{"missing"_sv, note}});
	REQUIRE(err);
	REQUIRE(err.message() == "required option 'missing' doesn't exist"_sv);

	REQUIRE(!args.rejectUnknownOptions({"id"_sv, "column"_sv, "value"_sv}));
	err = args.rejectUnknownOptions({"id"_sv, "column"_sv});
	REQUIRE(err);
	REQUIRE(err.message() == "unknown option 'value'"_sv);
}
