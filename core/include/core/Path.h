#pragma once

#include "core/Exports.h"
#include "core/Result.h"
#include "core/String.h"

namespace core
{
	class Path
	{
		static void join(String&) {}

		template<typename ... TArgs>
		static void join(String& result, StringView first, TArgs&& ... args)
		{
			if (result.count() > 0 && !(result.endsWith("/"_sv) || result.endsWith("\\"_sv)))
				result.pushByte('/');
			result.push(first);
			join(result, std::forward<TArgs>(args)...);
		}

	public:
		CORE_EXPORT static Result<String> abs(StringView path, Allocator* allocator);
		CORE_EXPORT static Result<String> workingDir(Allocator* allocator);
		CORE_EXPORT static Result<String> executableDir(Allocator* allocator);
		CORE_EXPORT static Result<String> tmpDir(Allocator* allocator);

		// returns an empty string if the variable is not set
		CORE_EXPORT static String env(StringView name, Allocator* allocator);

		template<typename ... TArgs>
		static String join(Allocator* allocator, TArgs&& ... args)
		{
			String result{allocator};
			join(result, std::forward<TArgs>(args)...);
			return clean(result, allocator);
		}

		CORE_EXPORT static bool isAbsolute(StringView path);

		// normalizes separators to '/' and removes duplicate and trailing separators
		CORE_EXPORT static String clean(StringView path, Allocator* allocator);

		// "a/b/c.txt" -> "c.txt"
		CORE_EXPORT static StringView fileName(StringView path);
		// "a/b/c.txt" -> "a/b"
		CORE_EXPORT static StringView directory(StringView path);
		// "a/b/c.txt" -> "a/b/c"
		CORE_EXPORT static StringView withoutExtension(StringView path);
	};
}
