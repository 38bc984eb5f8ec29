#include "kakeibo/Launcher.h"

#include <core/File.h>
#include <core/Path.h>
#include <core/Process.h>

#include <fmt/core.h>

#include <cstdio>

namespace kakeibo
{
	LauncherHooks systemLauncherHooks(core::Allocator* allocator)
	{
		LauncherHooks res{};
		res.exists = [allocator](core::StringView path) {
			return core::File::exists(path, allocator) && core::File::isDirectory(path, allocator) == false;
		};
		res.run = [allocator](core::StringView program, const core::Array<core::String>& args) {
			return core::Process::run(program, args, allocator);
		};
		res.print = [](core::StringView text) {
			fmt::print("{}\n", text);
			std::fflush(stdout);
		};
		res.pause = [] {
			fmt::print("続行するには Enter キーを押してください . . .");
			std::fflush(stdout);
			std::getchar();
		};
		return res;
	}

	core::Array<core::String> launcherCandidates(
		core::StringView exeDir,
		core::StringView workingDir,
		core::Func<core::String(core::StringView)> env,
		core::Allocator* allocator
	)
	{
		auto program = core::StringView{GUI_PROGRAM};

		core::Array<core::String> res{allocator};
		res.push(core::Path::join(allocator, exeDir, program));
		res.push(core::Path::join(allocator, exeDir, "bin"_sv, program));
		res.push(core::Path::join(allocator, workingDir, program));

		if (auto dir = env("LOCALAPPDATA"_sv); dir.count() > 0)
			res.push(core::Path::join(allocator, dir, "Programs"_sv, "kakeibo"_sv, program));
		if (auto dir = env("PROGRAMFILES"_sv); dir.count() > 0)
			res.push(core::Path::join(allocator, dir, "kakeibo"_sv, program));
		if (auto dir = env("PROGRAMFILES(X86)"_sv); dir.count() > 0)
			res.push(core::Path::join(allocator, dir, "kakeibo"_sv, program));
		if (auto dir = env("HOME"_sv); dir.count() > 0)
		{
			res.push(core::Path::join(allocator, dir, ".local"_sv, "bin"_sv, program));
			res.push(core::Path::join(allocator, dir, "bin"_sv, program));
		}

		res.push(core::Path::join(allocator, "/usr/local/bin"_sv, program));
		res.push(core::Path::join(allocator, "/usr/bin"_sv, program));
		return res;
	}

	LaunchTarget selectProgram(const core::Array<core::String>& candidates, LauncherHooks& hooks, core::Allocator* allocator)
	{
		for (const auto& candidate: candidates)
		{
			if (hooks.exists(candidate))
				return LaunchTarget{core::String{candidate, allocator}, false};
		}
		return LaunchTarget{core::String{core::StringView{GUI_PROGRAM}, allocator}, true};
	}

	core::String failureText(int exitCode, core::Allocator* allocator)
	{
		return core::strf(
			allocator,
			"エラーが発生しました (エラーコード: {})\n"
			"\n"
			"必要なライブラリがインストールされていない可能性があります。\n"
			"以下の3つのパッケージをインストールしてください:\n"
			"  - Qt6 Widgets\n"
			"  - SQLite3\n"
			"  - spdlog\n"
			"\n"
			"Debian/Ubuntu: sudo apt install libqt6widgets6 libsqlite3-0 libspdlog1.12\n"
			"Windows (vcpkg): vcpkg install qtbase sqlite3 spdlog"_sv,
			exitCode
		);
	}

	int launch(
		const core::Array<core::String>& candidates,
		const core::Array<core::String>& args,
		LauncherHooks& hooks,
		core::Allocator* allocator
	)
	{
		auto target = selectProgram(candidates, hooks, allocator);

		int exitCode = 0;
		auto runResult = hooks.run(target.program, args);
		if (runResult.isError())
		{
			hooks.print(core::strf(allocator, "{} を起動できませんでした: {}"_sv, target.program, runResult.error()));
			exitCode = 1;
		}
		else
		{
			exitCode = runResult.value();
		}

		if (exitCode == 0)
		{
			hooks.print(core::StringView{LAUNCH_SUCCESS_MESSAGE});
			return 0;
		}

		hooks.print(failureText(exitCode, allocator));
		hooks.pause();
		return exitCode;
	}
}
