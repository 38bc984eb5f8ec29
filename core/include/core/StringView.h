#pragma once

#include "core/Exports.h"
#include "core/Array.h"
#include "core/Span.h"
#include "core/Assert.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstring>
#include <cstdint>

namespace core
{
	class String;

	class StringView
	{
		friend class String;

		const char* m_begin = nullptr;
		size_t m_count = 0;

		CORE_EXPORT static int cmp(StringView a, StringView b);
	public:
		StringView() = default;

		explicit StringView(const char* ptr)
		{
			m_begin = ptr;
			m_count = ::strlen(ptr);
		}

		StringView(const char* begin, size_t count)
			: m_begin(begin)
			, m_count(count)
		{}

		StringView(const char* begin, const char* end)
			: m_begin(begin)
			, m_count(end - begin)
		{
			validate(begin <= end);
		}

		const char& operator[](size_t i) const
		{
			validate(i < m_count);
			return m_begin[i];
		}

		size_t count() const { return m_count; }
		bool empty() const { return m_count == 0; }

		const char* data() const { return m_begin; }
		const char* begin() const { return m_begin; }
		const char* end() const { return m_begin + m_count; }

		CORE_EXPORT size_t find(StringView target, size_t start = 0) const;
		CORE_EXPORT size_t find(char target, size_t start = 0) const;
		CORE_EXPORT size_t findLast(StringView target) const;

		bool operator==(StringView other) const
		{
			if (m_begin == other.m_begin && m_count == other.m_count)
				return true;

			return cmp(*this, other) == 0;
		}
		bool operator!=(StringView other) const { return !operator==(other); }
		bool operator<(StringView other) const { return cmp(*this, other) < 0; }
		bool operator<=(StringView other) const { return cmp(*this, other) <= 0; }
		bool operator>(StringView other) const { return cmp(*this, other) > 0; }
		bool operator>=(StringView other) const { return cmp(*this, other) >= 0; }

		StringView slice(size_t start, size_t end) const
		{
			validate(start <= end && end <= m_count);
			return StringView{m_begin + start, end - start};
		}

		StringView sliceRight(size_t start) const
		{
			return slice(start, m_count);
		}

		CORE_EXPORT Array<StringView> split(StringView delim, bool skipEmpty, Allocator* allocator) const;

		bool startsWith(StringView str) const
		{
			if (str.m_count > m_count)
				return false;

			return slice(0, str.m_count) == str;
		}

		bool endsWith(StringView str) const
		{
			if (str.m_count > m_count)
				return false;

			return slice(m_count - str.m_count, m_count) == str;
		}

		CORE_EXPORT StringView trimLeft(StringView cutset) const;
		CORE_EXPORT StringView trimRight(StringView cutset) const;

		// trims ascii whitespace and the ideographic space (U+3000)
		CORE_EXPORT StringView trim() const;

		CORE_EXPORT bool isValidUtf8() const;
	};
}

inline static core::StringView operator "" _sv(const char* ptr, size_t len)
{
	return core::StringView(ptr, len);
}

namespace fmt
{
	template<>
	struct formatter<core::StringView>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const core::StringView& str, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
