#include "core/Process.h"
#include "core/winos/OSString.h"

#include <Windows.h>

namespace core
{
	// quotes an argument the way CommandLineToArgvW expects to read it back
	static void pushQuoted(String& cmdline, StringView arg)
	{
		if (arg.count() > 0 && arg.find(' ') == SIZE_MAX && arg.find('\t') == SIZE_MAX && arg.find('"') == SIZE_MAX)
		{
			cmdline.push(arg);
			return;
		}

		cmdline.pushByte('"');
		size_t backslashes = 0;
		for (auto c: arg)
		{
			if (c == '\\')
			{
				++backslashes;
				continue;
			}

			if (c == '"')
				backslashes = backslashes * 2 + 1;
			for (size_t i = 0; i < backslashes; ++i)
				cmdline.pushByte('\\');
			backslashes = 0;
			cmdline.pushByte(c);
		}
		for (size_t i = 0; i < backslashes * 2; ++i)
			cmdline.pushByte('\\');
		cmdline.pushByte('"');
	}

	Result<int> Process::run(StringView program, const Array<String>& args, Allocator* allocator)
	{
		String cmdline{allocator};
		pushQuoted(cmdline, program);
		for (const auto& arg: args)
		{
			cmdline.pushByte(' ');
			pushQuoted(cmdline, arg);
		}

		auto osCmdline = OSString{cmdline, allocator};

		STARTUPINFOW startupInfo{};
		startupInfo.cb = sizeof(startupInfo);
		PROCESS_INFORMATION processInfo{};

		// a null application name makes CreateProcess search PATH for the first token
		auto res = CreateProcessW(nullptr, osCmdline.data(), nullptr, nullptr, FALSE, 0, nullptr, nullptr, &startupInfo, &processInfo);
		if (res == FALSE)
			return errf(allocator, "failed to start '{}', ErrorCode({})"_sv, program, GetLastError());

		WaitForSingleObject(processInfo.hProcess, INFINITE);

		DWORD exitCode = 0;
		auto ok = GetExitCodeProcess(processInfo.hProcess, &exitCode);
		auto lastError = GetLastError();
		CloseHandle(processInfo.hThread);
		CloseHandle(processInfo.hProcess);
		if (ok == FALSE)
			return errf(allocator, "failed to get the exit code of '{}', ErrorCode({})"_sv, program, lastError);
		return int(exitCode);
	}
}
