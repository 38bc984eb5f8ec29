#include "core/ConditionVariable.h"
#include "core/winos/IMutex.h"

#include <Windows.h>

namespace core
{
	struct ConditionVariable::IConditionVariable
	{
		CONDITION_VARIABLE cv;
	};

	ConditionVariable::ConditionVariable(Allocator* allocator)
	{
		m_condition_variable = unique_from<IConditionVariable>(allocator);
		InitializeConditionVariable(&m_condition_variable->cv);
	}

	ConditionVariable::ConditionVariable(ConditionVariable&& other) noexcept = default;
	ConditionVariable& ConditionVariable::operator=(ConditionVariable&& other) noexcept = default;
	ConditionVariable::~ConditionVariable() = default;

	void ConditionVariable::wait(Mutex& mutex)
	{
		SleepConditionVariableCS(&m_condition_variable->cv, &mutex.m_mutex->cs, INFINITE);
	}

	bool ConditionVariable::waitFor(Mutex& mutex, std::chrono::milliseconds timeout)
	{
		auto ms = timeout.count() < 0 ? 0 : timeout.count();
		if (ms >= INFINITE)
			ms = INFINITE - 1;
		auto res = SleepConditionVariableCS(&m_condition_variable->cv, &mutex.m_mutex->cs, DWORD(ms));
		return res != FALSE || GetLastError() != ERROR_TIMEOUT;
	}

	void ConditionVariable::notify_one()
	{
		WakeConditionVariable(&m_condition_variable->cv);
	}

	void ConditionVariable::notify_all()
	{
		WakeAllConditionVariable(&m_condition_variable->cv);
	}
}
