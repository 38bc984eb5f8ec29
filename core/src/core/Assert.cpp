#include "core/Assert.h"

#include "core/Mallocator.h"
#include "core/Log.h"

namespace core
{
	inline core::Log* defaultAssertLog()
	{
		static Mallocator mallocator;
		static Log log{&mallocator};
		return &log;
	}

	inline core::Log* __ASSERT_LOG = nullptr;

	core::Log* setAssertLog(core::Log* log)
	{
		auto res = __ASSERT_LOG;
		__ASSERT_LOG = log;
		return res;
	}

	void validateMsg(bool expr, const char* msg, std::source_location loc)
	{
		#ifdef KAKEIBO_ENABLE_ASSERTS
			if (expr)
				return;

			auto log = __ASSERT_LOG ? __ASSERT_LOG : defaultAssertLog();
			auto file = loc.file_name();
			auto function = loc.function_name();
			auto line = loc.line();
			if (msg)
				log->critical("Assertion Failure: {}, message: {}, in file: {}, function: {}, line: {}"_sv, expr, msg, file, function, line);
			else
				log->critical("Assertion Failure: {}, in file: {}, function: {}, line: {}"_sv, expr, file, function, line);
			log->flush();

			#if KAKEIBO_COMPILER_MSVC
				__debugbreak();
			#elif KAKEIBO_COMPILER_CLANG || KAKEIBO_COMPILER_GNU
				__builtin_trap();
			#else
				#error unknown compiler
			#endif
		#else
			(void)expr;
			(void)msg;
			(void)loc;
		#endif
	}
}
