#pragma once

#include "core/Exports.h"
#include "core/Mutex.h"
#include "core/Unique.h"

#include <chrono>

namespace core
{
	class ConditionVariable
	{
		struct IConditionVariable;
		Unique<IConditionVariable> m_condition_variable;

	public:
		CORE_EXPORT explicit ConditionVariable(Allocator* allocator);
		CORE_EXPORT ConditionVariable(ConditionVariable&& other) noexcept;
		CORE_EXPORT ConditionVariable& operator=(ConditionVariable&& other) noexcept;
		CORE_EXPORT ~ConditionVariable();

		CORE_EXPORT void wait(Mutex& mutex);

		template <typename Predicate>
		void wait(Mutex& mutex, Predicate&& predicate)
		{
			while (!predicate())
			{
				wait(mutex);
			}
		}

		// returns false if the timeout elapsed without a notification
		CORE_EXPORT bool waitFor(Mutex& mutex, std::chrono::milliseconds timeout);

		// returns the predicate's value at the time the wait ended
		template <typename Predicate>
		bool waitUntil(Mutex& mutex, std::chrono::system_clock::time_point deadline, Predicate&& predicate)
		{
			while (!predicate())
			{
				auto now = std::chrono::system_clock::now();
				if (now >= deadline)
					return predicate();
				waitFor(mutex, std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
			}
			return true;
		}

		CORE_EXPORT void notify_one();
		CORE_EXPORT void notify_all();
	};
}
