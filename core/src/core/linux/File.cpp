#include "core/File.h"
#include "core/Path.h"

#include <fcntl.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

namespace core
{
	static HumanError writeAll(int handle, StringView data, StringView path, Allocator* allocator)
	{
		size_t written = 0;
		while (written < data.count())
		{
			auto res = ::write(handle, data.data() + written, data.count() - written);
			if (res == -1)
			{
				if (errno == EINTR)
					continue;
				return errf(allocator, "failed to write to file '{}', {}"_sv, path, strerror(errno));
			}
			written += size_t(res);
		}
		return {};
	}

	Result<String> File::content(StringView path, Allocator* allocator)
	{
		auto cPath = String{path, allocator};
		auto handle = ::open(cPath.c_str(), O_RDONLY);
		if (handle == -1)
			return errf(allocator, "failed to open file '{}', {}"_sv, path, strerror(errno));

		String result{allocator};
		char buffer[4096];
		while (true)
		{
			auto res = ::read(handle, buffer, sizeof(buffer));
			if (res == -1)
			{
				if (errno == EINTR)
					continue;
				auto err = errf(allocator, "failed to read file '{}', {}"_sv, path, strerror(errno));
				::close(handle);
				return err;
			}
			if (res == 0)
				break;
			result.push(StringView{buffer, size_t(res)});
		}
		::close(handle);
		return result;
	}

	HumanError File::write(StringView path, StringView data, OPEN_MODE mode, Allocator* allocator)
	{
		int flags = O_WRONLY | O_CREAT;
		switch (mode)
		{
		case OPEN_MODE_CREATE_ONLY:
			flags |= O_EXCL;
			break;
		case OPEN_MODE_CREATE_OVERWRITE:
		default:
			flags |= O_TRUNC;
			break;
		}

		auto cPath = String{path, allocator};
		auto handle = ::open(cPath.c_str(), flags, 0644);
		if (handle == -1)
			return errf(allocator, "failed to create file '{}', {}"_sv, path, strerror(errno));

		auto err = writeAll(handle, data, path, allocator);
		::close(handle);
		return err;
	}

	HumanError File::copy(StringView src, StringView dst, Allocator* allocator)
	{
		auto cSrc = String{src, allocator};
		auto srcHandle = ::open(cSrc.c_str(), O_RDONLY);
		if (srcHandle == -1)
			return errf(allocator, "failed to open file '{}', {}"_sv, src, strerror(errno));

		auto cDst = String{dst, allocator};
		auto dstHandle = ::open(cDst.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
		if (dstHandle == -1)
		{
			auto err = errf(allocator, "failed to create file '{}', {}"_sv, dst, strerror(errno));
			::close(srcHandle);
			return err;
		}

		HumanError err{};
		char buffer[16 * 1024];
		while (true)
		{
			auto res = ::read(srcHandle, buffer, sizeof(buffer));
			if (res == -1)
			{
				if (errno == EINTR)
					continue;
				err = errf(allocator, "failed to read file '{}', {}"_sv, src, strerror(errno));
				break;
			}
			if (res == 0)
				break;

			err = writeAll(dstHandle, StringView{buffer, size_t(res)}, dst, allocator);
			if (err)
				break;
		}

		::close(srcHandle);
		::close(dstHandle);
		if (err)
			::unlink(cDst.c_str());
		return err;
	}

	HumanError File::remove(StringView path, Allocator* allocator)
	{
		auto cPath = String{path, allocator};
		if (::remove(cPath.c_str()) == -1)
			return errf(allocator, "failed to remove '{}', {}"_sv, path, strerror(errno));
		return {};
	}

	bool File::exists(StringView path, Allocator* allocator)
	{
		auto cPath = String{path, allocator};
		struct stat st{};
		return ::stat(cPath.c_str(), &st) == 0;
	}

	bool File::isDirectory(StringView path, Allocator* allocator)
	{
		auto cPath = String{path, allocator};
		struct stat st{};
		if (::stat(cPath.c_str(), &st) != 0)
			return false;
		return S_ISDIR(st.st_mode);
	}

	HumanError File::createDirectories(StringView path, Allocator* allocator)
	{
		if (path.count() == 0)
			return {};

		auto cleanPath = Path::clean(path, allocator);
		if (isDirectory(cleanPath, allocator))
			return {};

		auto parent = Path::directory(cleanPath);
		if (parent.count() > 0 && parent != StringView{cleanPath})
		{
			if (auto err = createDirectories(parent, allocator))
				return err;
		}

		if (::mkdir(cleanPath.c_str(), 0755) == -1)
		{
			auto error = errno;
			if (error == EEXIST && isDirectory(cleanPath, allocator))
				return {};
			return errf(allocator, "failed to create directory '{}', {}"_sv, path, strerror(error));
		}
		return {};
	}
}
