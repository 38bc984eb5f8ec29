#pragma once

#include "core/Exports.h"
#include "core/StringView.h"
#include "core/String.h"
#include "core/Result.h"

namespace core
{
	class File
	{
	public:
		enum OPEN_MODE
		{
			// creates the file if it doesn't exist, if it exists the function will fail
			OPEN_MODE_CREATE_ONLY,
			// creates the file if it doesn't exist, if it exists it will be overwritten
			OPEN_MODE_CREATE_OVERWRITE,
		};

		CORE_EXPORT static Result<String> content(StringView path, Allocator* allocator);
		CORE_EXPORT static HumanError write(StringView path, StringView data, OPEN_MODE mode, Allocator* allocator);
		// byte for byte copy, fails if dst exists
		CORE_EXPORT static HumanError copy(StringView src, StringView dst, Allocator* allocator);
		// removes a file or an empty directory
		CORE_EXPORT static HumanError remove(StringView path, Allocator* allocator);

		CORE_EXPORT static bool exists(StringView path, Allocator* allocator);
		CORE_EXPORT static bool isDirectory(StringView path, Allocator* allocator);
		// creates the directory and any missing parents, succeeds if it already exists
		CORE_EXPORT static HumanError createDirectories(StringView path, Allocator* allocator);
	};
}
