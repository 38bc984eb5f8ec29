#pragma once

#include "core/Exports.h"
#include "core/Unique.h"
#include "core/Func.h"

namespace core
{
	class Thread
	{
		struct IThread;
		Unique<IThread> m_thread;
	public:
		CORE_EXPORT Thread(Allocator* allocator, Func<void()> func);
		CORE_EXPORT Thread(Thread&& other) noexcept;
		CORE_EXPORT Thread& operator=(Thread&& other) noexcept;
		CORE_EXPORT ~Thread();

		CORE_EXPORT void join();
		CORE_EXPORT bool joinable() const;

		// blocks the calling thread
		CORE_EXPORT static void sleepMs(int64_t milliseconds);
	};
}
