#include "kakeibo/Reminder.h"

#include <chrono>

namespace kakeibo
{
	DateTime nextFireTime(const DateTime& now, TimeOfDay at)
	{
		DateTime res{};
		res.date = now.date;
		res.hour = at.hour;
		res.minute = at.minute;
		res.second = 0;

		if (secondsBetween(now, res) <= 0)
		{
			res.date = Date{std::chrono::sys_days{now.date} + std::chrono::days{1}};
		}
		return res;
	}

	Reminder::Reminder(TimeOfDay at, core::Func<void()> callback, core::Allocator* allocator)
		: m_allocator(allocator),
		  m_at(at),
		  m_callback(std::move(callback)),
		  m_clock([] { return kakeibo::now(); }),
		  m_mutex(allocator),
		  m_condition(allocator)
	{}

	Reminder::~Reminder()
	{
		stop();
	}

	void Reminder::loop()
	{
		while (true)
		{
			auto current = m_clock();
			auto next = nextFireTime(current, m_at);
			auto deadline = std::chrono::system_clock::now() + std::chrono::seconds{secondsBetween(current, next)};

			{
				auto lock = core::lockGuard(m_mutex);
				if (m_condition.waitUntil(m_mutex, deadline, [this] { return m_stop; }))
					return;
			}

			m_callback();
		}
	}

	void Reminder::start()
	{
		if (m_thread)
			return;

		{
			auto lock = core::lockGuard(m_mutex);
			m_stop = false;
		}
		m_thread = core::unique_from<core::Thread>(m_allocator, m_allocator, core::Func<void()>{[this] { loop(); }});
	}

	void Reminder::stop()
	{
		if (!m_thread)
			return;

		{
			auto lock = core::lockGuard(m_mutex);
			m_stop = true;
		}
		m_condition.notify_all();
		m_thread->join();
		m_thread = nullptr;
	}
}
