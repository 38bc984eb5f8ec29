#include "kakeibo/Csv.h"

#include <core/File.h>

namespace kakeibo
{
	constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

	CsvWriter::CsvWriter(core::Allocator* allocator)
		: m_buffer(core::StringView{UTF8_BOM}, allocator)
	{}

	void CsvWriter::field(core::StringView value)
	{
		if (m_rowStarted)
			m_buffer.pushByte(',');
		m_rowStarted = true;

		auto needsQuotes =
			value.find(',') != SIZE_MAX ||
			value.find('"') != SIZE_MAX ||
			value.find('\n') != SIZE_MAX ||
			value.find('\r') != SIZE_MAX;
		if (needsQuotes == false)
		{
			m_buffer.push(value);
			return;
		}

		m_buffer.pushByte('"');
		for (auto c: value)
		{
			if (c == '"')
				m_buffer.pushByte('"');
			m_buffer.pushByte(c);
		}
		m_buffer.pushByte('"');
	}

	void CsvWriter::endRow()
	{
		m_buffer.push("\r\n"_sv);
		m_rowStarted = false;
	}

	core::HumanError CsvWriter::save(core::StringView path)
	{
		return core::File::write(path, m_buffer, core::File::OPEN_MODE_CREATE_OVERWRITE, m_buffer.allocator());
	}

	core::Result<core::Array<CsvRow>> parseCsv(core::StringView content, core::Allocator* allocator)
	{
		if (content.startsWith(core::StringView{UTF8_BOM}))
			content = content.sliceRight(3);

		core::Array<CsvRow> rows{allocator};
		CsvRow row{allocator};
		core::String field{allocator};
		bool inQuotes = false;
		// a quoted field or a separator makes the row non blank
		bool rowHasContent = false;
		// only a separator or a line break may follow the closing quote of a field
		bool quoteClosed = false;
		size_t line = 1;

		auto endField = [&]() {
			row.push(std::move(field));
			field = core::String{allocator};
			quoteClosed = false;
		};

		auto endRow = [&]() {
			endField();
			if (rowHasContent || row.count() > 1 || row[0].count() > 0)
				rows.push(std::move(row));
			row = CsvRow{allocator};
			rowHasContent = false;
		};

		for (size_t i = 0; i < content.count(); ++i)
		{
			auto c = content[i];
			if (inQuotes)
			{
				if (c == '"')
				{
					if (i + 1 < content.count() && content[i + 1] == '"')
					{
						field.pushByte('"');
						++i;
					}
					else
					{
						inQuotes = false;
						quoteClosed = true;
					}
				}
				else
				{
					if (c == '\n')
						++line;
					field.pushByte(c);
				}
				continue;
			}

			if (quoteClosed && c != ',' && c != '\r' && c != '\n')
				return core::errf(allocator, "line {}: unexpected character after a closing quote"_sv, line);

			switch (c)
			{
			case '"':
				if (field.count() > 0)
					return core::errf(allocator, "line {}: unexpected quote inside an unquoted field"_sv, line);
				inQuotes = true;
				rowHasContent = true;
				break;
			case ',':
				endField();
				rowHasContent = true;
				break;
			case '\r':
				if (i + 1 < content.count() && content[i + 1] == '\n')
					++i;
				endRow();
				++line;
				break;
			case '\n':
				endRow();
				++line;
				break;
			default:
				field.pushByte(c);
				break;
			}
		}

		if (inQuotes)
			return core::errf(allocator, "line {}: unterminated quoted field"_sv, line);

		if (field.count() > 0 || row.count() > 0 || rowHasContent)
			endRow();

		return rows;
	}
}
