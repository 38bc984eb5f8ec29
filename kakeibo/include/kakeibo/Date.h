#pragma once

#include "kakeibo/Exports.h"

#include <core/Result.h>
#include <core/String.h>

#include <chrono>

namespace kakeibo
{
	using Date = std::chrono::year_month_day;
	using Month = std::chrono::year_month;

	// local wall clock time, seconds resolution
	struct DateTime
	{
		Date date;
		int hour = 0;
		int minute = 0;
		int second = 0;
	};

	struct TimeOfDay
	{
		int hour = 20;
		int minute = 0;
	};

	// accepts YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, YYYYMMDD, YYYY年MM月DD日,
	// 令和N年MM月DD日 (令和元年 too) and RN/MM/DD, month and day may be a single digit
	KAKEIBO_EXPORT core::Result<Date> parseDate(core::StringView text, core::Allocator* allocator);
	// YYYY-MM
	KAKEIBO_EXPORT core::Result<Month> parseMonth(core::StringView text, core::Allocator* allocator);
	// HH:MM
	KAKEIBO_EXPORT core::Result<TimeOfDay> parseTimeOfDay(core::StringView text, core::Allocator* allocator);

	KAKEIBO_EXPORT core::String formatDate(Date date, core::Allocator* allocator);
	KAKEIBO_EXPORT core::String formatMonth(Month month, core::Allocator* allocator);
	KAKEIBO_EXPORT core::String formatTimeOfDay(TimeOfDay time, core::Allocator* allocator);
	// YYYYMMDD_HHMMSS, used in backup file names
	KAKEIBO_EXPORT core::String formatStamp(const DateTime& time, core::Allocator* allocator);

	inline Month monthOf(Date date)
	{
		return Month{date.year(), date.month()};
	}

	// seconds between two local times, positive when b is after a
	KAKEIBO_EXPORT int64_t secondsBetween(const DateTime& a, const DateTime& b);
	KAKEIBO_EXPORT DateTime addSeconds(const DateTime& time, int64_t seconds);

	KAKEIBO_EXPORT DateTime now();
	KAKEIBO_EXPORT Date today();
}
