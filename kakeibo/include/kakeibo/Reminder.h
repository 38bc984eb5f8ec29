#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Date.h"

#include <core/ConditionVariable.h>
#include <core/Func.h>
#include <core/Mutex.h>
#include <core/Thread.h>
#include <core/Unique.h>

namespace kakeibo
{
	constexpr const char* REMINDER_MESSAGE = "今日の家計簿入力は済んでるかな？";

	// first time strictly after now whose wall clock reads at
	KAKEIBO_EXPORT DateTime nextFireTime(const DateTime& now, TimeOfDay at);

	// fires the callback once a day on its own thread, the callback must not block for long
	// and must hand any gui work over to the gui thread
	class Reminder
	{
		core::Allocator* m_allocator = nullptr;
		TimeOfDay m_at;
		core::Func<void()> m_callback;
		core::Func<DateTime()> m_clock;
		core::Mutex m_mutex;
		core::ConditionVariable m_condition;
		bool m_stop = false;
		core::Unique<core::Thread> m_thread;

		void loop();
	public:
		KAKEIBO_EXPORT Reminder(TimeOfDay at, core::Func<void()> callback, core::Allocator* allocator);
		KAKEIBO_EXPORT ~Reminder();

		Reminder(const Reminder&) = delete;
		Reminder& operator=(const Reminder&) = delete;
		Reminder(Reminder&&) = delete;
		Reminder& operator=(Reminder&&) = delete;

		// replaces the local wall clock, must be called before start
		void setClock(core::Func<DateTime()> clock) { m_clock = std::move(clock); }

		TimeOfDay at() const { return m_at; }
		bool running() const { return bool(m_thread); }

		KAKEIBO_EXPORT void start();
		// wakes the thread and joins it, safe to call when not running
		KAKEIBO_EXPORT void stop();
	};
}
