#include "core/Encoding.h"

#include <iconv.h>
#include <errno.h>
#include <string.h>

namespace core
{
	Result<String> cp932ToUtf8(StringView text, Allocator* allocator)
	{
		auto cd = iconv_open("UTF-8", "CP932");
		if (cd == (iconv_t)-1)
			return errf(allocator, "failed to open cp932 converter, {}"_sv, strerror(errno));

		// a cp932 byte never becomes more than 3 utf-8 bytes
		String result{allocator};
		result.resize(text.count() * 3);

		auto in = const_cast<char*>(text.data());
		auto inLeft = text.count();
		auto out = result.data();
		auto outLeft = result.count();
		auto rc = iconv(cd, &in, &inLeft, &out, &outLeft);
		auto error = errno;
		iconv_close(cd);
		if (rc == (size_t)-1)
			return errf(allocator, "invalid cp932 text at byte {}, {}"_sv, text.count() - inLeft, strerror(error));

		result.resize(result.count() - outLeft);
		return result;
	}
}
