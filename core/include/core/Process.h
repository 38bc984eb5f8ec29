#pragma once

#include "core/Exports.h"
#include "core/Array.h"
#include "core/Result.h"
#include "core/String.h"

namespace core
{
	class Process
	{
	public:
		// runs program with the given arguments, waits for it, and returns its exit code.
		// a program without a directory part is searched for in PATH
		CORE_EXPORT static Result<int> run(StringView program, const Array<String>& args, Allocator* allocator);
	};
}
