#pragma once

#include "kakeibo/Exports.h"

#include <core/Array.h>
#include <core/Func.h>
#include <core/Result.h>
#include <core/String.h>

namespace kakeibo
{
#if defined(_WIN32)
	constexpr const char* GUI_PROGRAM = "kakeibo-gui.exe";
#else
	constexpr const char* GUI_PROGRAM = "kakeibo-gui";
#endif

	constexpr const char* LAUNCH_SUCCESS_MESSAGE = "家計簿アプリが正常に終了しました。";

	// the launcher's contact with the outside world, replaced in tests
	struct LauncherHooks
	{
		core::Func<bool(core::StringView)> exists;
		core::Func<core::Result<int>(core::StringView, const core::Array<core::String>&)> run;
		core::Func<void(core::StringView)> print;
		core::Func<void()> pause;
	};

	// file system checks, process spawning, stdout and a key press on stdin
	KAKEIBO_EXPORT LauncherHooks systemLauncherHooks(core::Allocator* allocator);

	// the fixed install locations in probing order, locations under an unset variable are left out
	KAKEIBO_EXPORT core::Array<core::String> launcherCandidates(
		core::StringView exeDir,
		core::StringView workingDir,
		core::Func<core::String(core::StringView)> env,
		core::Allocator* allocator
	);

	struct LaunchTarget
	{
		core::String program;
		// true when no candidate exists and the program is looked up through PATH
		bool fromPath = false;
	};

	// the first existing candidate, later candidates are not probed
	KAKEIBO_EXPORT LaunchTarget selectProgram(const core::Array<core::String>& candidates, LauncherHooks& hooks, core::Allocator* allocator);

	// error line with the exit code followed by the runtime packages and how to install them
	KAKEIBO_EXPORT core::String failureText(int exitCode, core::Allocator* allocator);

	// runs the gui with args, reports the outcome and returns the exit code, pauses only on failure
	KAKEIBO_EXPORT int launch(
		const core::Array<core::String>& candidates,
		const core::Array<core::String>& args,
		LauncherHooks& hooks,
		core::Allocator* allocator
	);
}
