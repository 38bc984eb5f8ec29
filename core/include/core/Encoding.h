#pragma once

#include "core/Exports.h"
#include "core/Result.h"
#include "core/String.h"

namespace core
{
	// converts text in the japanese windows code page (cp932, the shift_jis superset excel writes)
	// to utf-8, fails on byte sequences that are not valid cp932
	CORE_EXPORT Result<String> cp932ToUtf8(StringView text, Allocator* allocator);
}
