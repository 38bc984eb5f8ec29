#include "kakeibo/Date.h"

#include <ctime>

namespace kakeibo
{
	namespace
	{
		class Scanner
		{
			core::StringView m_text;
			size_t m_pos = 0;
		public:
			explicit Scanner(core::StringView text)
				: m_text(text)
			{}

			bool done() const { return m_pos == m_text.count(); }

			bool literal(core::StringView str)
			{
				if (m_text.sliceRight(m_pos).startsWith(str) == false)
					return false;
				m_pos += str.count();
				return true;
			}

			// reads between min and max decimal digits
			bool number(size_t min, size_t max, int& out)
			{
				size_t count = 0;
				int value = 0;
				while (m_pos + count < m_text.count() && count < max)
				{
					auto c = m_text[m_pos + count];
					if (c < '0' || c > '9')
						break;
					value = value * 10 + (c - '0');
					++count;
				}
				if (count < min)
					return false;
				m_pos += count;
				out = value;
				return true;
			}
		};

		// reiwa 1 is 2019
		constexpr int REIWA_BASE_YEAR = 2018;

		bool parseSeparated(core::StringView text, char separator, int& y, int& m, int& d)
		{
			Scanner s{text};
			auto sep = core::StringView{&separator, 1};
			return s.number(4, 4, y) && s.literal(sep) &&
				s.number(1, 2, m) && s.literal(sep) &&
				s.number(1, 2, d) && s.done();
		}

		bool parseCompact(core::StringView text, int& y, int& m, int& d)
		{
			Scanner s{text};
			return s.number(4, 4, y) && s.number(2, 2, m) && s.number(2, 2, d) && s.done();
		}

		bool parseKanji(core::StringView text, int& y, int& m, int& d)
		{
			Scanner s{text};
			return s.number(4, 4, y) && s.literal("年"_sv) &&
				s.number(1, 2, m) && s.literal("月"_sv) &&
				s.number(1, 2, d) && s.literal("日"_sv) && s.done();
		}

		bool parseReiwa(core::StringView text, int& y, int& m, int& d)
		{
			Scanner s{text};
			if (s.literal("令和"_sv) == false)
				return false;

			int era = 0;
			if (s.literal("元"_sv))
				era = 1;
			else if (s.number(1, 2, era) == false)
				return false;

			if ((s.literal("年"_sv) && s.number(1, 2, m) && s.literal("月"_sv) && s.number(1, 2, d) && s.literal("日"_sv) && s.done()) == false)
				return false;

			if (era < 1)
				return false;
			y = REIWA_BASE_YEAR + era;
			return true;
		}

		bool parseReiwaShort(core::StringView text, int& y, int& m, int& d)
		{
			Scanner s{text};
			int era = 0;
			if ((s.literal("R"_sv) && s.number(1, 2, era) && s.literal("/"_sv) &&
				s.number(1, 2, m) && s.literal("/"_sv) &&
				s.number(1, 2, d) && s.done()) == false)
			{
				return false;
			}

			if (era < 1)
				return false;
			y = REIWA_BASE_YEAR + era;
			return true;
		}

		std::tm localTm(std::time_t t)
		{
			std::tm res{};
		#if defined(_WIN32)
			localtime_s(&res, &t);
		#else
			localtime_r(&t, &res);
		#endif
			return res;
		}

		std::chrono::sys_seconds toSysSeconds(const DateTime& time)
		{
			using namespace std::chrono;
			return sys_days{time.date} + hours{time.hour} + minutes{time.minute} + seconds{time.second};
		}
	}

	core::Result<Date> parseDate(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();
		if (trimmed.count() == 0)
			return core::errf(allocator, "日付が入力されていません"_sv);

		int y = 0, m = 0, d = 0;
		auto parsed =
			parseSeparated(trimmed, '-', y, m, d) ||
			parseSeparated(trimmed, '/', y, m, d) ||
			parseSeparated(trimmed, '.', y, m, d) ||
			parseCompact(trimmed, y, m, d) ||
			parseKanji(trimmed, y, m, d) ||
			parseReiwa(trimmed, y, m, d) ||
			parseReiwaShort(trimmed, y, m, d);
		if (parsed == false)
			return core::errf(allocator, "日付形式が正しくありません: '{}'"_sv, trimmed);

		auto date = Date{std::chrono::year{y}, std::chrono::month{unsigned(m)}, std::chrono::day{unsigned(d)}};
		if (y < 1 || date.ok() == false)
			return core::errf(allocator, "存在しない日付です: '{}'"_sv, trimmed);
		return date;
	}

	core::Result<Month> parseMonth(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();

		Scanner s{trimmed};
		int y = 0, m = 0;
		if ((s.number(4, 4, y) && s.literal("-"_sv) && s.number(2, 2, m) && s.done()) == false)
			return core::errf(allocator, "月はYYYY-MM形式で入力してください: '{}'"_sv, trimmed);

		auto month = Month{std::chrono::year{y}, std::chrono::month{unsigned(m)}};
		if (y < 1 || month.ok() == false)
			return core::errf(allocator, "存在しない月です: '{}'"_sv, trimmed);
		return month;
	}

	core::Result<TimeOfDay> parseTimeOfDay(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();

		Scanner s{trimmed};
		TimeOfDay res{};
		if ((s.number(1, 2, res.hour) && s.literal(":"_sv) && s.number(2, 2, res.minute) && s.done()) == false)
			return core::errf(allocator, "time should be in HH:MM format, '{}'"_sv, trimmed);

		if (res.hour > 23 || res.minute > 59)
			return core::errf(allocator, "time is out of range, '{}'"_sv, trimmed);
		return res;
	}

	core::String formatDate(Date date, core::Allocator* allocator)
	{
		return core::strf(
			allocator,
			"{:04}-{:02}-{:02}"_sv,
			int(date.year()),
			unsigned(date.month()),
			unsigned(date.day())
		);
	}

	core::String formatMonth(Month month, core::Allocator* allocator)
	{
		return core::strf(allocator, "{:04}-{:02}"_sv, int(month.year()), unsigned(month.month()));
	}

	core::String formatTimeOfDay(TimeOfDay time, core::Allocator* allocator)
	{
		return core::strf(allocator, "{:02}:{:02}"_sv, time.hour, time.minute);
	}

	core::String formatStamp(const DateTime& time, core::Allocator* allocator)
	{
		return core::strf(
			allocator,
			"{:04}{:02}{:02}_{:02}{:02}{:02}"_sv,
			int(time.date.year()),
			unsigned(time.date.month()),
			unsigned(time.date.day()),
			time.hour,
			time.minute,
			time.second
		);
	}

	int64_t secondsBetween(const DateTime& a, const DateTime& b)
	{
		return (toSysSeconds(b) - toSysSeconds(a)).count();
	}

	DateTime addSeconds(const DateTime& time, int64_t seconds)
	{
		using namespace std::chrono;

		auto t = toSysSeconds(time) + std::chrono::seconds{seconds};
		auto day = floor<days>(t);
		hh_mm_ss<std::chrono::seconds> hms{t - day};

		DateTime res{};
		res.date = Date{day};
		res.hour = int(hms.hours().count());
		res.minute = int(hms.minutes().count());
		res.second = int(hms.seconds().count());
		return res;
	}

	DateTime now()
	{
		auto tm = localTm(std::time(nullptr));

		DateTime res{};
		res.date = Date{
			std::chrono::year{tm.tm_year + 1900},
			std::chrono::month{unsigned(tm.tm_mon + 1)},
			std::chrono::day{unsigned(tm.tm_mday)}
		};
		res.hour = tm.tm_hour;
		res.minute = tm.tm_min;
		res.second = tm.tm_sec;
		return res;
	}

	Date today()
	{
		return now().date;
	}
}
