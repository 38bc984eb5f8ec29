#include "core/Path.h"
#include "core/winos/OSString.h"

#include <Windows.h>

namespace core
{
	Result<String> Path::workingDir(Allocator* allocator)
	{
		auto requiredSize = GetCurrentDirectoryW(0, nullptr);
		if (requiredSize == 0)
			return errf(allocator, "GetCurrentDirectory failed, ErrorCode({})"_sv, GetLastError());

		Array<wchar_t> buffer{allocator};
		for (DWORD i = 0; i < requiredSize; ++i)
			buffer.push(L'\0');
		auto writtenSize = GetCurrentDirectoryW(requiredSize, buffer.data());
		if (writtenSize == 0)
			return errf(allocator, "GetCurrentDirectory failed, ErrorCode({})"_sv, GetLastError());

		auto result = OSString{std::move(buffer)}.toUtf8(allocator);
		return clean(result, allocator);
	}

	Result<String> Path::executableDir(Allocator* allocator)
	{
		Array<wchar_t> buffer{allocator};
		for (size_t i = 0; i < MAX_PATH + 1; ++i)
			buffer.push(L'\0');

		while (true)
		{
			auto writtenSize = GetModuleFileNameW(nullptr, buffer.data(), DWORD(buffer.count()));
			if (writtenSize == 0)
				return errf(allocator, "GetModuleFileName failed, ErrorCode({})"_sv, GetLastError());
			if (writtenSize < buffer.count())
				break;
			// truncated, try again with twice the space
			auto count = buffer.count();
			for (size_t i = 0; i < count; ++i)
				buffer.push(L'\0');
		}

		auto exe = clean(OSString{std::move(buffer)}.toUtf8(allocator), allocator);
		return String{directory(exe), allocator};
	}

	Result<String> Path::tmpDir(Allocator* allocator)
	{
		Array<wchar_t> buffer{allocator};
		for (size_t i = 0; i < MAX_PATH + 2; ++i)
			buffer.push(L'\0');
		auto writtenSize = GetTempPathW(DWORD(buffer.count()), buffer.data());
		if (writtenSize == 0)
			return errf(allocator, "GetTempPath failed, ErrorCode({})"_sv, GetLastError());

		auto result = OSString{std::move(buffer)}.toUtf8(allocator);
		return clean(result, allocator);
	}

	String Path::env(StringView name, Allocator* allocator)
	{
		auto osName = OSString{name, allocator};
		auto requiredSize = GetEnvironmentVariableW(osName.data(), nullptr, 0);
		if (requiredSize == 0)
			return String{allocator};

		Array<wchar_t> buffer{allocator};
		for (DWORD i = 0; i < requiredSize; ++i)
			buffer.push(L'\0');
		GetEnvironmentVariableW(osName.data(), buffer.data(), requiredSize);
		return OSString{std::move(buffer)}.toUtf8(allocator);
	}
}
