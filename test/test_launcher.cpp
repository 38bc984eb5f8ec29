#include <core/Mallocator.h>
#include <core/Path.h>

#include <kakeibo/Launcher.h>

#include <doctest/doctest.h>

namespace
{
	struct FakeSystem
	{
		core::Array<core::String> existing;
		core::Array<core::String> probed;
		core::Array<core::String> printed;
		core::String ranProgram;
		core::Array<core::String> ranArgs;
		int pauses = 0;
		int exitCode = 0;
		bool runFails = false;

		explicit FakeSystem(core::Allocator* allocator)
			: existing(allocator),
			  probed(allocator),
			  printed(allocator),
			  ranProgram(allocator),
			  ranArgs(allocator)
		{}

		kakeibo::LauncherHooks hooks(core::Allocator* allocator)
		{
			kakeibo::LauncherHooks res{};
			res.exists = [this](core::StringView path) {
				probed.push(core::String{path, probed.allocator()});
				for (const auto& e: existing)
					if (e == path)
						return true;
				return false;
			};
			res.run = [this, allocator](core::StringView program, const core::Array<core::String>& args) -> core::Result<int> {
				ranProgram = core::String{program, allocator};
				ranArgs = args;
				if (runFails)
					return core::errf(allocator, "no such file or directory"_sv);
				return exitCode;
			};
			res.print = [this](core::StringView text) {
				printed.push(core::String{text, printed.allocator()});
			};
			res.pause = [this] { ++pauses; };
			return res;
		}
	};

	core::Func<core::String(core::StringView)> envOf(core::StringView home, core::Allocator* allocator)
	{
		return [home, allocator](core::StringView name) {
			if (name == "HOME"_sv)
				return core::String{home, allocator};
			return core::String{allocator};
		};
	}
}

TEST_CASE("kakeibo::launcherCandidates")
{
	core::Mallocator allocator;
	auto program = core::StringView{kakeibo::GUI_PROGRAM};

	auto candidates = kakeibo::launcherCandidates("/opt/kakeibo"_sv, "/work"_sv, envOf("/home/taro"_sv, &allocator), &allocator);
	REQUIRE(candidates.count() == 7);
	REQUIRE(candidates[0] == core::Path::join(&allocator, "/opt/kakeibo"_sv, program));
	REQUIRE(candidates[1] == core::Path::join(&allocator, "/opt/kakeibo/bin"_sv, program));
	REQUIRE(candidates[2] == core::Path::join(&allocator, "/work"_sv, program));
	REQUIRE(candidates[3] == core::Path::join(&allocator, "/home/taro/.local/bin"_sv, program));
	REQUIRE(candidates[4] == core::Path::join(&allocator, "/home/taro/bin"_sv, program));
	REQUIRE(candidates[5] == core::Path::join(&allocator, "/usr/local/bin"_sv, program));
	REQUIRE(candidates[6] == core::Path::join(&allocator, "/usr/bin"_sv, program));

	// nothing under an unset HOME
	auto noHome = kakeibo::launcherCandidates("/opt/kakeibo"_sv, "/work"_sv, envOf(""_sv, &allocator), &allocator);
	REQUIRE(noHome.count() == 5);
}

TEST_CASE("kakeibo::launch")
{
	core::Mallocator allocator;
	FakeSystem system{&allocator};
	auto hooks = system.hooks(&allocator);

	core::Array<core::String> candidates{&allocator};
	candidates.push(core::String{"/a/kakeibo-gui"_sv, &allocator});
	candidates.push(core::String{"/b/kakeibo-gui"_sv, &allocator});
	candidates.push(core::String{"/c/kakeibo-gui"_sv, &allocator});

	core::Array<core::String> args{&allocator};
	args.push(core::String{"--reminder=off"_sv, &allocator});

	SUBCASE("first existing candidate and success")
	{
		system.existing.push(core::String{"/b/kakeibo-gui"_sv, &allocator});
		system.existing.push(core::String{"/c/kakeibo-gui"_sv, &allocator});

		REQUIRE(kakeibo::launch(candidates, args, hooks, &allocator) == 0);
		REQUIRE(system.ranProgram == "/b/kakeibo-gui"_sv);
		REQUIRE(system.ranArgs.count() == 1);
		REQUIRE(system.ranArgs[0] == "--reminder=off"_sv);

		// probing stops at the first hit
		REQUIRE(system.probed.count() == 2);

		REQUIRE(system.printed.count() == 1);
		REQUIRE(system.printed[0] == core::StringView{kakeibo::LAUNCH_SUCCESS_MESSAGE});
		REQUIRE(system.pauses == 0);
	}

	SUBCASE("falls back to PATH")
	{
		auto target = kakeibo::selectProgram(candidates, hooks, &allocator);
		REQUIRE(target.fromPath);
		REQUIRE(target.program == core::StringView{kakeibo::GUI_PROGRAM});
		REQUIRE(system.probed.count() == 3);
	}

	SUBCASE("failure exit code")
	{
		system.existing.push(core::String{"/a/kakeibo-gui"_sv, &allocator});
		system.exitCode = 3;

		REQUIRE(kakeibo::launch(candidates, args, hooks, &allocator) == 3);
		REQUIRE(system.printed.count() == 1);
		REQUIRE(system.printed[0].startsWith("エラーが発生しました (エラーコード: 3)\n"_sv));
		REQUIRE(system.printed[0].find("  - Qt6 Widgets\n  - SQLite3\n  - spdlog\n"_sv) != SIZE_MAX);
		REQUIRE(system.pauses == 1);
	}

	SUBCASE("program that can't start")
	{
		system.runFails = true;

		REQUIRE(kakeibo::launch(candidates, args, hooks, &allocator) == 1);
		REQUIRE(system.ranProgram == core::StringView{kakeibo::GUI_PROGRAM});
		REQUIRE(system.printed.count() == 2);
		REQUIRE(system.printed[0].find("を起動できませんでした: no such file or directory"_sv) != SIZE_MAX);
		REQUIRE(system.printed[1].startsWith("エラーが発生しました (エラーコード: 1)"_sv));
		REQUIRE(system.pauses == 1);
	}
}

TEST_CASE("kakeibo::launch with none of the ten locations present")
{
	core::Mallocator allocator;
	FakeSystem system{&allocator};
	auto hooks = system.hooks(&allocator);

	auto env = [&allocator](core::StringView name) {
		if (name == "LOCALAPPDATA"_sv)
			return core::String{"C:/Users/taro/AppData/Local"_sv, &allocator};
		if (name == "PROGRAMFILES"_sv)
			return core::String{"C:/Program Files"_sv, &allocator};
		if (name == "PROGRAMFILES(X86)"_sv)
			return core::String{"C:/Program Files (x86)"_sv, &allocator};
		if (name == "HOME"_sv)
			return core::String{"/home/taro"_sv, &allocator};
		return core::String{&allocator};
	};

	auto candidates = kakeibo::launcherCandidates("/opt/kakeibo"_sv, "/work"_sv, env, &allocator);
	REQUIRE(candidates.count() == 10);
	REQUIRE(candidates[3] == core::Path::join(&allocator, "C:/Users/taro/AppData/Local/Programs/kakeibo"_sv, core::StringView{kakeibo::GUI_PROGRAM}));

	core::Array<core::String> args{&allocator};
	REQUIRE(kakeibo::launch(candidates, args, hooks, &allocator) == 0);
	REQUIRE(system.probed.count() == 10);
	REQUIRE(system.ranProgram == core::StringView{kakeibo::GUI_PROGRAM});
	REQUIRE(system.pauses == 0);
}
