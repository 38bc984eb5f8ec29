#include "Fixture.h"

#include <core/File.h>
#include <core/Log.h>
#include <core/Mallocator.h>

TEST_CASE("core::Log::openFile appends")
{
	core::Mallocator allocator;
	TempDir dir{&allocator};

	auto path = dir.file("kakeibo.log"_sv);
	REQUIRE(!core::File::write(path, "existing line\n"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));

	{
		auto logResult = core::Log::openFile(path, &allocator);
		REQUIRE(logResult.isError() == false);
		auto log = logResult.releaseValue();
		log.info("新規レコード追加: ID={}"_sv, 1);
		log.flush();
	}

	auto content = core::File::content(path, &allocator).releaseValue();
	REQUIRE(content.startsWith("existing line\n"_sv));
	REQUIRE(content.find(" - info - 新規レコード追加: ID=1"_sv) != SIZE_MAX);
}

TEST_CASE("core::Log::openFile fails on a missing directory")
{
	core::Mallocator allocator;
	TempDir dir{&allocator};

	auto path = core::Path::join(&allocator, dir.path(), "missing"_sv, "kakeibo.log"_sv);
	// spdlog creates missing parent directories, a file in place of the directory can't be bypassed
	auto blocker = dir.file("missing"_sv);
	REQUIRE(!core::File::write(blocker, "not a directory"_sv, core::File::OPEN_MODE_CREATE_ONLY, &allocator));

	auto logResult = core::Log::openFile(path, &allocator);
	REQUIRE(logResult.isError());
}
