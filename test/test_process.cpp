#include <doctest/doctest.h>

#include <core/Mallocator.h>
#include <core/Process.h>

#if !defined(_WIN32)

TEST_CASE("core::Process::run exit codes")
{
	core::Mallocator allocator;

	core::Array<core::String> args{&allocator};
	args.push(core::String{"-c"_sv, &allocator});
	args.push(core::String{"exit 3"_sv, &allocator});

	auto codeResult = core::Process::run("sh"_sv, args, &allocator);
	REQUIRE(codeResult.isError() == false);
	REQUIRE(codeResult.value() == 3);

	args[1] = core::String{"exit 0"_sv, &allocator};
	codeResult = core::Process::run("/bin/sh"_sv, args, &allocator);
	REQUIRE(codeResult.isError() == false);
	REQUIRE(codeResult.value() == 0);
}

TEST_CASE("core::Process::run missing program")
{
	core::Mallocator allocator;

	core::Array<core::String> args{&allocator};
	auto codeResult = core::Process::run("kakeibo-no-such-program"_sv, args, &allocator);
	REQUIRE(codeResult.isError());
}

#endif
