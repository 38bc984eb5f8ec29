#include <doctest/doctest.h>

#include <core/Encoding.h>
#include <core/Mallocator.h>
#include <core/String.h>
#include <core/StringView.h>

TEST_CASE("core::StringView find")
{
	REQUIRE("hello world"_sv.find("hello world"_sv) == 0);
	REQUIRE("hello world"_sv.find("hello"_sv) == 0);
	REQUIRE("hello world"_sv.find("hello"_sv, 1) == SIZE_MAX);
	REQUIRE("hello world"_sv.find("world"_sv) == 6);
	REQUIRE("hello world"_sv.find('o') == 4);
	REQUIRE("hello world"_sv.find('o', 5) == 7);
	REQUIRE("hello world"_sv.find("hello world hello"_sv) == SIZE_MAX);
	REQUIRE(""_sv.find("hello"_sv) == SIZE_MAX);
}

TEST_CASE("core::StringView findLast")
{
	REQUIRE("a.b.csv"_sv.findLast("."_sv) == 3);
	REQUIRE("hello world"_sv.findLast("world"_sv) == 6);
	REQUIRE("hello"_sv.findLast("hello world"_sv) == SIZE_MAX);
}

TEST_CASE("core::StringView split")
{
	core::Mallocator allocator;

	auto parts = "2024-01,2024-02,,2024-03"_sv.split(","_sv, true, &allocator);
	REQUIRE(parts.count() == 3);
	REQUIRE(parts[0] == "2024-01"_sv);
	REQUIRE(parts[1] == "2024-02"_sv);
	REQUIRE(parts[2] == "2024-03"_sv);

	auto withEmpty = "a,,b,"_sv.split(","_sv, false, &allocator);
	REQUIRE(withEmpty.count() == 4);
	REQUIRE(withEmpty[1] == ""_sv);
	REQUIRE(withEmpty[3] == ""_sv);
}

TEST_CASE("core::StringView trim")
{
	REQUIRE("  食費 \t\r\n"_sv.trim() == "食費"_sv);
	// ideographic spaces typed with a japanese ime
	REQUIRE("\xE3\x80\x80" "支出" "\xE3\x80\x80 "_sv.trim() == "支出"_sv);
	REQUIRE("   "_sv.trim().count() == 0);
	REQUIRE("--x--"_sv.trimLeft("-"_sv) == "x--"_sv);
	REQUIRE("--x--"_sv.trimRight("-"_sv) == "--x"_sv);
}

TEST_CASE("core::StringView isValidUtf8")
{
	REQUIRE("家計簿"_sv.isValidUtf8());
	REQUIRE("plain ascii"_sv.isValidUtf8());
	REQUIRE(""_sv.isValidUtf8());

	// shift_jis encoded 家計簿
	const char sjis[] = {'\x89', '\xC6', '\x8C', '\x76', '\x95', '\xEB'};
	REQUIRE(core::StringView{sjis, sizeof(sjis)}.isValidUtf8() == false);

	// truncated multibyte sequence
	REQUIRE("\xE5\xAE"_sv.isValidUtf8() == false);
}

TEST_CASE("core::String push and replace")
{
	core::Mallocator allocator;

	core::String str{&allocator};
	str.push("収入"_sv);
	str.pushByte(',');
	str.push("支出"_sv);
	REQUIRE(str == "収入,支出"_sv);
	REQUIRE(str.endsWith("支出"_sv));

	str.replace(","_sv, " / "_sv);
	REQUIRE(str == "収入 / 支出"_sv);
}

TEST_CASE("core::strf")
{
	core::Mallocator allocator;

	auto str = core::strf(&allocator, "{}: {:04}"_sv, "年"_sv, 7);
	REQUIRE(str == "年: 0007"_sv);
}

TEST_CASE("core::cp932ToUtf8")
{
	core::Mallocator allocator;

	// 家計簿 and half width カ
	auto converted = core::cp932ToUtf8("\x89\xC6\x8C\x76\x95\xEB,\xB6"_sv, &allocator);
	REQUIRE(converted.isError() == false);
	REQUIRE(converted.value() == "家計簿,ｶ"_sv);

	REQUIRE(core::cp932ToUtf8("abc"_sv, &allocator).value() == "abc"_sv);
	REQUIRE(core::cp932ToUtf8(""_sv, &allocator).value().count() == 0);

	// a lead byte with no trail byte
	REQUIRE(core::cp932ToUtf8("a\x89"_sv, &allocator).isError());
}
