#pragma once

#include "core/Array.h"
#include "core/String.h"

namespace core
{
	// null terminated utf-16 copy of a utf-8 string for the W family of win32 calls
	class OSString
	{
		Array<wchar_t> m_buffer;
	public:
		OSString(StringView str, Allocator* allocator);

		explicit OSString(Array<wchar_t> buffer)
			: m_buffer(std::move(buffer))
		{}

		const wchar_t* data() const { return m_buffer.data(); }
		wchar_t* data() { return m_buffer.data(); }

		String toUtf8(Allocator* allocator) const;
	};
}
