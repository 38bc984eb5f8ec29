#include "core/Encoding.h"
#include "core/winos/OSString.h"

#include <Windows.h>

namespace core
{
	constexpr UINT CODE_PAGE_CP932 = 932;

	Result<String> cp932ToUtf8(StringView text, Allocator* allocator)
	{
		if (text.count() == 0)
			return String{allocator};

		auto countNeeded = MultiByteToWideChar(CODE_PAGE_CP932, MB_ERR_INVALID_CHARS, text.data(), int(text.count()), nullptr, 0);
		if (countNeeded == 0)
			return errf(allocator, "invalid cp932 text, ErrorCode({})"_sv, GetLastError());

		// +1 for the null termination
		Array<wchar_t> buffer{allocator};
		for (int i = 0; i < countNeeded + 1; ++i)
			buffer.push(L'\0');
		if (MultiByteToWideChar(CODE_PAGE_CP932, MB_ERR_INVALID_CHARS, text.data(), int(text.count()), buffer.data(), countNeeded) == 0)
			return errf(allocator, "invalid cp932 text, ErrorCode({})"_sv, GetLastError());

		return OSString{std::move(buffer)}.toUtf8(allocator);
	}
}
