#include "core/StringView.h"

#include <utf8proc.h>

namespace core
{
	int StringView::cmp(StringView a, StringView b)
	{
		auto min_count = a.m_count < b.m_count ? a.m_count : b.m_count;
		auto res = min_count > 0 ? ::memcmp(a.m_begin, b.m_begin, min_count) : 0;
		// NOTE: Possible that a[:min_count] == b[:min_count] but a>b, or vice versa, like "ABC" and "AB"
		if (res == 0)
		{
			if (a.m_count == b.m_count)
				return 0;
			else if (a.m_count > b.m_count)
				return 1;
			else
				return -1;
		}
		else
		{
			return res;
		}
	}

	size_t StringView::find(StringView target, size_t start) const
	{
		if (target.m_count == 0)
			return start <= m_count ? start : SIZE_MAX;

		if (start >= m_count || m_count - start < target.m_count)
			return SIZE_MAX;

		for (size_t i = start; i + target.m_count <= m_count; ++i)
		{
			if (m_begin[i] == target.m_begin[0] && ::memcmp(m_begin + i, target.m_begin, target.m_count) == 0)
				return i;
		}
		return SIZE_MAX;
	}

	size_t StringView::find(char target, size_t start) const
	{
		for (size_t i = start; i < m_count; ++i)
			if (m_begin[i] == target)
				return i;
		return SIZE_MAX;
	}

	size_t StringView::findLast(StringView target) const
	{
		if (target.m_count > m_count)
			return SIZE_MAX;

		for (size_t i = m_count - target.m_count + 1; i > 0; --i)
		{
			if (::memcmp(m_begin + i - 1, target.m_begin, target.m_count) == 0)
				return i - 1;
		}
		return SIZE_MAX;
	}

	Array<StringView> StringView::split(StringView delim, bool skipEmpty, Allocator* allocator) const
	{
		Array<StringView> res{allocator};
		if (delim.m_count == 0)
		{
			if (m_count > 0 || skipEmpty == false)
				res.push(*this);
			return res;
		}

		size_t it = 0;
		while (it <= m_count)
		{
			auto next = find(delim, it);
			if (next == SIZE_MAX)
				next = m_count;

			auto part = slice(it, next);
			if (part.m_count > 0 || skipEmpty == false)
				res.push(part);

			it = next + delim.m_count;
		}
		return res;
	}

	StringView StringView::trimLeft(StringView cutset) const
	{
		auto self = *this;
		while (self.m_count > 0 && cutset.find(self.m_begin[0]) != SIZE_MAX)
		{
			++self.m_begin;
			--self.m_count;
		}
		return self;
	}

	StringView StringView::trimRight(StringView cutset) const
	{
		auto self = *this;
		while (self.m_count > 0 && cutset.find(self.m_begin[self.m_count - 1]) != SIZE_MAX)
			--self.m_count;
		return self;
	}

	StringView StringView::trim() const
	{
		auto WHITESPACE = " \t\r\n\v\f"_sv;
		// U+3000 IDEOGRAPHIC SPACE
		auto IDEOGRAPHIC_SPACE = "\xE3\x80\x80"_sv;

		auto self = *this;
		while (true)
		{
			auto before = self.m_count;
			self = self.trimLeft(WHITESPACE).trimRight(WHITESPACE);
			if (self.startsWith(IDEOGRAPHIC_SPACE))
				self = self.sliceRight(IDEOGRAPHIC_SPACE.count());
			if (self.endsWith(IDEOGRAPHIC_SPACE))
				self = self.slice(0, self.m_count - IDEOGRAPHIC_SPACE.count());
			if (self.m_count == before)
				break;
		}
		return self;
	}

	bool StringView::isValidUtf8() const
	{
		auto ptr = (const utf8proc_uint8_t*)m_begin;
		auto remaining = (utf8proc_ssize_t)m_count;
		while (remaining > 0)
		{
			utf8proc_int32_t codepoint = 0;
			auto width = utf8proc_iterate(ptr, remaining, &codepoint);
			if (width <= 0 || codepoint < 0)
				return false;
			ptr += width;
			remaining -= width;
		}
		return true;
	}
}
