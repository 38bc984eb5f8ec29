#pragma once

#include "kakeibo/Exports.h"

#include <core/Array.h>
#include <core/Result.h>
#include <core/String.h>

#include <initializer_list>

namespace kakeibo
{
	// writes rfc 4180 csv with \r\n line endings, starts with a utf-8 bom so excel detects the encoding
	class CsvWriter
	{
		core::String m_buffer;
		bool m_rowStarted = false;
	public:
		KAKEIBO_EXPORT explicit CsvWriter(core::Allocator* allocator);

		KAKEIBO_EXPORT void field(core::StringView value);
		KAKEIBO_EXPORT void endRow();

		void row(std::initializer_list<core::StringView> fields)
		{
			for (auto f: fields)
				field(f);
			endRow();
		}

		core::StringView content() const { return m_buffer; }

		KAKEIBO_EXPORT core::HumanError save(core::StringView path);
	};

	using CsvRow = core::Array<core::String>;

	// parses quoted fields with embedded quotes and newlines, a leading bom is skipped, blank lines are skipped
	KAKEIBO_EXPORT core::Result<core::Array<CsvRow>> parseCsv(core::StringView content, core::Allocator* allocator);
}
