#include "core/ConditionVariable.h"
#include "core/Assert.h"
#include "core/linux/IMutex.h"

#include <pthread.h>
#include <time.h>
#include <errno.h>

namespace core
{
	struct ConditionVariable::IConditionVariable
	{
		pthread_cond_t cv;
	};

	ConditionVariable::ConditionVariable(Allocator* allocator)
	{
		m_condition_variable = unique_from<IConditionVariable>(allocator);

		// timed waits use the monotonic clock so wall clock changes don't stretch them
		pthread_condattr_t attr;
		pthread_condattr_init(&attr);
		pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
		[[maybe_unused]] auto res = pthread_cond_init(&m_condition_variable->cv, &attr);
		pthread_condattr_destroy(&attr);
		validate(res == 0);
	}

	ConditionVariable::ConditionVariable(ConditionVariable&& other) noexcept = default;
	ConditionVariable& ConditionVariable::operator=(ConditionVariable&& other) noexcept = default;

	ConditionVariable::~ConditionVariable()
	{
		if (m_condition_variable)
		{
			[[maybe_unused]] auto res = pthread_cond_destroy(&m_condition_variable->cv);
			validate(res == 0);
		}
	}

	void ConditionVariable::wait(Mutex& mutex)
	{
		[[maybe_unused]] auto res = pthread_cond_wait(&m_condition_variable->cv, &mutex.m_mutex->handle);
		validate(res == 0);
	}

	bool ConditionVariable::waitFor(Mutex& mutex, std::chrono::milliseconds timeout)
	{
		timespec deadline{};
		clock_gettime(CLOCK_MONOTONIC, &deadline);

		auto ms = timeout.count() < 0 ? 0 : timeout.count();
		deadline.tv_sec += ms / 1000;
		deadline.tv_nsec += (ms % 1000) * 1000000;
		if (deadline.tv_nsec >= 1000000000)
		{
			deadline.tv_sec += 1;
			deadline.tv_nsec -= 1000000000;
		}

		auto res = pthread_cond_timedwait(&m_condition_variable->cv, &mutex.m_mutex->handle, &deadline);
		return res != ETIMEDOUT;
	}

	void ConditionVariable::notify_one()
	{
		pthread_cond_signal(&m_condition_variable->cv);
	}

	void ConditionVariable::notify_all()
	{
		pthread_cond_broadcast(&m_condition_variable->cv);
	}
}
