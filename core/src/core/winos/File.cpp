#include "core/File.h"
#include "core/Path.h"
#include "core/winos/OSString.h"

#include <Windows.h>

namespace core
{
	Result<String> File::content(StringView path, Allocator* allocator)
	{
		auto osPath = OSString{path, allocator};
		auto handle = CreateFileW(osPath.data(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
		if (handle == INVALID_HANDLE_VALUE)
			return errf(allocator, "failed to open file '{}', ErrorCode({})"_sv, path, GetLastError());

		String result{allocator};
		char buffer[4096];
		while (true)
		{
			DWORD readSize = 0;
			if (ReadFile(handle, buffer, sizeof(buffer), &readSize, nullptr) == FALSE)
			{
				auto err = errf(allocator, "failed to read file '{}', ErrorCode({})"_sv, path, GetLastError());
				CloseHandle(handle);
				return err;
			}
			if (readSize == 0)
				break;
			result.push(StringView{buffer, size_t(readSize)});
		}
		CloseHandle(handle);
		return result;
	}

	HumanError File::write(StringView path, StringView data, OPEN_MODE mode, Allocator* allocator)
	{
		DWORD disposition = CREATE_ALWAYS;
		switch (mode)
		{
		case OPEN_MODE_CREATE_ONLY:
			disposition = CREATE_NEW;
			break;
		case OPEN_MODE_CREATE_OVERWRITE:
		default:
			disposition = CREATE_ALWAYS;
			break;
		}

		auto osPath = OSString{path, allocator};
		auto handle = CreateFileW(osPath.data(), GENERIC_WRITE, 0, nullptr, disposition, FILE_ATTRIBUTE_NORMAL, nullptr);
		if (handle == INVALID_HANDLE_VALUE)
			return errf(allocator, "failed to create file '{}', ErrorCode({})"_sv, path, GetLastError());

		size_t written = 0;
		while (written < data.count())
		{
			DWORD writtenSize = 0;
			if (WriteFile(handle, data.data() + written, DWORD(data.count() - written), &writtenSize, nullptr) == FALSE)
			{
				auto err = errf(allocator, "failed to write to file '{}', ErrorCode({})"_sv, path, GetLastError());
				CloseHandle(handle);
				return err;
			}
			written += writtenSize;
		}
		CloseHandle(handle);
		return {};
	}

	HumanError File::copy(StringView src, StringView dst, Allocator* allocator)
	{
		auto osSrc = OSString{src, allocator};
		auto osDst = OSString{dst, allocator};
		// TRUE makes the call fail when the destination exists
		if (CopyFileW(osSrc.data(), osDst.data(), TRUE) == FALSE)
			return errf(allocator, "failed to copy '{}' to '{}', ErrorCode({})"_sv, src, dst, GetLastError());
		return {};
	}

	HumanError File::remove(StringView path, Allocator* allocator)
	{
		auto osPath = OSString{path, allocator};
		auto attributes = GetFileAttributesW(osPath.data());
		auto removed = attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_DIRECTORY)
			? RemoveDirectoryW(osPath.data())
			: DeleteFileW(osPath.data());
		if (removed == FALSE)
			return errf(allocator, "failed to remove '{}', ErrorCode({})"_sv, path, GetLastError());
		return {};
	}

	bool File::exists(StringView path, Allocator* allocator)
	{
		auto osPath = OSString{path, allocator};
		return GetFileAttributesW(osPath.data()) != INVALID_FILE_ATTRIBUTES;
	}

	bool File::isDirectory(StringView path, Allocator* allocator)
	{
		auto osPath = OSString{path, allocator};
		auto attributes = GetFileAttributesW(osPath.data());
		return attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_DIRECTORY);
	}

	HumanError File::createDirectories(StringView path, Allocator* allocator)
	{
		if (path.count() == 0)
			return {};

		auto cleanPath = Path::clean(path, allocator);
		if (isDirectory(cleanPath, allocator))
			return {};

		auto parent = Path::directory(cleanPath);
		// stop at drive roots like "C:"
		if (parent.count() > 0 && parent != StringView{cleanPath} && parent.endsWith(":"_sv) == false)
		{
			if (auto err = createDirectories(parent, allocator))
				return err;
		}

		auto osPath = OSString{cleanPath, allocator};
		if (CreateDirectoryW(osPath.data(), nullptr) == FALSE)
		{
			auto error = GetLastError();
			if (error == ERROR_ALREADY_EXISTS && isDirectory(cleanPath, allocator))
				return {};
			return errf(allocator, "failed to create directory '{}', ErrorCode({})"_sv, path, error);
		}
		return {};
	}
}
