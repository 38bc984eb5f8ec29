#include "core/Path.h"

#include <unistd.h>
#include <stdlib.h>
#include <limits.h>
#include <errno.h>
#include <string.h>

namespace core
{
	Result<String> Path::workingDir(Allocator* allocator)
	{
		String result{allocator};
		result.resize(PATH_MAX + 1);
		auto res = getcwd(result.data(), result.count());
		if (res == nullptr)
			return errf(allocator, "getcwd failed, ErrorCode({})"_sv, errno);
		result.resize(strlen(result.data()));
		return result;
	}

	Result<String> Path::executableDir(Allocator* allocator)
	{
		String result{allocator};
		result.resize(PATH_MAX + 1);
		auto len = readlink("/proc/self/exe", result.data(), result.count());
		if (len == -1)
			return errf(allocator, "readlink(/proc/self/exe) failed, ErrorCode({})"_sv, errno);
		result.resize(size_t(len));
		return String{directory(result), allocator};
	}

	Result<String> Path::tmpDir(Allocator* allocator)
	{
		if (auto p = secure_getenv("TMPDIR"))
			return String{StringView{p}, allocator};
		else if (auto p = secure_getenv("TMP"))
			return String{StringView{p}, allocator};
		else if (auto p = secure_getenv("TEMP"))
			return String{StringView{p}, allocator};
		else
			return String{"/tmp"_sv, allocator};
	}

	String Path::env(StringView name, Allocator* allocator)
	{
		auto cName = String{name, allocator};
		if (auto p = getenv(cName.c_str()))
			return String{StringView{p}, allocator};
		return String{allocator};
	}
}
