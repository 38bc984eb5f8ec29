#include "core/Path.h"

namespace core
{
	bool Path::isAbsolute(StringView path)
	{
		if (path.startsWith("/"_sv) || path.startsWith("\\"_sv))
			return true;
		// windows drive letter, C:/ or C:\ form
		if (path.count() >= 3 && path[1] == ':' && (path[2] == '/' || path[2] == '\\'))
			return true;
		return false;
	}

	String Path::clean(StringView path, Allocator* allocator)
	{
		String result{allocator};

		char prev = '\0';
		for (auto c: path)
		{
			if (c == '\\')
				c = '/';

			if (c == '/' && prev == '/')
				continue;

			result.pushByte(c);
			prev = c;
		}
		if (prev == '/' && result.count() > 1)
			result.resize(result.count() - 1);
		return result;
	}

	StringView Path::fileName(StringView path)
	{
		for (size_t i = path.count(); i > 0; --i)
		{
			auto c = path[i - 1];
			if (c == '/' || c == '\\')
				return path.sliceRight(i);
		}
		return path;
	}

	StringView Path::directory(StringView path)
	{
		for (size_t i = path.count(); i > 0; --i)
		{
			auto c = path[i - 1];
			if (c == '/' || c == '\\')
			{
				// keep the root separator of "/file"
				if (i == 1)
					return path.slice(0, 1);
				return path.slice(0, i - 1);
			}
		}
		return StringView{};
	}

	StringView Path::withoutExtension(StringView path)
	{
		auto name = fileName(path);
		auto dot = name.findLast("."_sv);
		if (dot == SIZE_MAX || dot == 0)
			return path;
		return path.slice(0, path.count() - (name.count() - dot));
	}

	Result<String> Path::abs(StringView path, Allocator* allocator)
	{
		if (isAbsolute(path))
			return clean(path, allocator);

		auto workingDirResult = workingDir(allocator);
		if (workingDirResult.isError())
			return workingDirResult.releaseError();

		return join(allocator, workingDirResult.releaseValue(), path);
	}
}
