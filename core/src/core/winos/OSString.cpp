#include "core/winos/OSString.h"

#include <Windows.h>

namespace core
{
	OSString::OSString(StringView str, Allocator* allocator)
		: m_buffer(allocator)
	{
		auto countNeeded = MultiByteToWideChar(CP_UTF8, 0, str.data(), int(str.count()), nullptr, 0);

		// +1 for the null termination
		for (int i = 0; i < countNeeded + 1; ++i)
			m_buffer.push(L'\0');
		if (countNeeded > 0)
			MultiByteToWideChar(CP_UTF8, 0, str.data(), int(str.count()), m_buffer.data(), countNeeded);
	}

	String OSString::toUtf8(Allocator* allocator) const
	{
		String str{allocator};
		if (m_buffer.count() == 0)
			return str;

		// -1 makes the count include the null terminator
		auto countNeeded = WideCharToMultiByte(CP_UTF8, 0, m_buffer.data(), -1, nullptr, 0, nullptr, nullptr);
		if (countNeeded <= 1)
			return str;

		str.resize(size_t(countNeeded - 1));
		WideCharToMultiByte(CP_UTF8, 0, m_buffer.data(), -1, str.data(), countNeeded - 1, nullptr, nullptr);
		return str;
	}
}
