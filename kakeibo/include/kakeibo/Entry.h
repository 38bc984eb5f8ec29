#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Date.h"

#include <core/Result.h>
#include <core/String.h>

namespace kakeibo
{
	enum CATEGORY
	{
		CATEGORY_INCOME,
		CATEGORY_EXPENSE,
	};

	// the stored and displayed names, 収入 and 支出
	KAKEIBO_EXPORT core::StringView categoryName(CATEGORY category);
	KAKEIBO_EXPORT core::Result<CATEGORY> parseCategory(core::StringView text, core::Allocator* allocator);

	// finite and non-negative
	KAKEIBO_EXPORT core::Result<double> parseAmount(core::StringView text, core::Allocator* allocator);
	KAKEIBO_EXPORT core::HumanError validateAmount(double amount, core::Allocator* allocator);
	KAKEIBO_EXPORT core::Result<core::String> parseSubject(core::StringView text, core::Allocator* allocator);

	struct NewEntry
	{
		Date date;
		CATEGORY category;
		core::String subject;
		double amount;
	};

	struct Entry
	{
		int64_t id;
		Date date;
		CATEGORY category;
		core::String subject;
		double amount;
	};

	// validates raw form/csv/cli text into an entry
	KAKEIBO_EXPORT core::Result<NewEntry> parseEntry(
		core::StringView date,
		core::StringView category,
		core::StringView subject,
		core::StringView amount,
		core::Allocator* allocator
	);

	enum COLUMN
	{
		COLUMN_DATE,
		COLUMN_CATEGORY,
		COLUMN_SUBJECT,
		COLUMN_AMOUNT,
	};

	KAKEIBO_EXPORT core::StringView columnName(COLUMN column);
	KAKEIBO_EXPORT core::Result<COLUMN> parseColumn(core::StringView text, core::Allocator* allocator);
}
