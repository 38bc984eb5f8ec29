#include "core/Thread.h"
#include "core/Assert.h"

#include <Windows.h>

namespace core
{
	struct Thread::IThread
	{
		HANDLE handle;
		Func<void()> func;
		bool joined = false;
	};

	Thread::Thread(Allocator* allocator, Func<void()> func)
	{
		auto thread_start = +[](LPVOID user_data) -> DWORD
		{
			auto thread = (Thread::IThread*)user_data;
			thread->func();
			return 0;
		};

		m_thread = unique_from<IThread>(allocator);
		m_thread->func = std::move(func);
		m_thread->handle = CreateThread(nullptr, 0, thread_start, m_thread.get(), 0, nullptr);
		validate(m_thread->handle != nullptr);
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
		[[maybe_unused]] auto res = WaitForSingleObject(m_thread->handle, INFINITE);
		validate(res == WAIT_OBJECT_0);
		CloseHandle(m_thread->handle);
		m_thread->joined = true;
	}

	bool Thread::joinable() const
	{
		return m_thread && m_thread->joined == false;
	}

	void Thread::sleepMs(int64_t milliseconds)
	{
		Sleep(DWORD(milliseconds));
	}
}
