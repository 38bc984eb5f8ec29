#include "core/Thread.h"
#include "core/Assert.h"

#include <pthread.h>
#include <time.h>
#include <errno.h>

namespace core
{
	struct Thread::IThread
	{
		pthread_t handle;
		Func<void()> func;
		bool joined = false;
	};

	Thread::Thread(Allocator* allocator, Func<void()> func)
	{
		auto thread_start = +[](void* user_data) -> void*
		{
			auto thread = (Thread::IThread*)(user_data);
			thread->func();
			return nullptr;
		};

		m_thread = unique_from<IThread>(allocator);
		m_thread->func = std::move(func);
		[[maybe_unused]] auto res = pthread_create(&m_thread->handle, nullptr, thread_start, m_thread.get());
		validate(res == 0);
	}

	Thread::Thread(Thread&& other) noexcept = default;

	Thread& Thread::operator=(Thread&& other) noexcept
	{
		if (joinable())
			join();
		m_thread = std::move(other.m_thread);
		return *this;
	}

	Thread::~Thread()
	{
		if (joinable())
			join();
	}

	void Thread::join()
	{
		validate(joinable());
		[[maybe_unused]] auto res = pthread_join(m_thread->handle, nullptr);
		validate(res == 0);
		m_thread->joined = true;
	}

	bool Thread::joinable() const
	{
		return m_thread && m_thread->joined == false;
	}

	void Thread::sleepMs(int64_t milliseconds)
	{
		timespec ts{};
		ts.tv_sec = milliseconds / 1000;
		ts.tv_nsec = (milliseconds % 1000) * 1000000;
		while (nanosleep(&ts, &ts) == -1 && errno == EINTR)
		{}
	}
}
