#include "kakeibo/Entry.h"

#include <charconv>
#include <cmath>

namespace kakeibo
{
	core::StringView categoryName(CATEGORY category)
	{
		switch (category)
		{
		case CATEGORY_INCOME: return "収入"_sv;
		case CATEGORY_EXPENSE: return "支出"_sv;
		default:
			core::unreachable();
			return {};
		}
	}

	core::Result<CATEGORY> parseCategory(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();
		if (trimmed == categoryName(CATEGORY_INCOME))
			return CATEGORY_INCOME;
		else if (trimmed == categoryName(CATEGORY_EXPENSE))
			return CATEGORY_EXPENSE;
		return core::errf(allocator, "区分は「収入」または「支出」を指定してください: '{}'"_sv, trimmed);
	}

	core::HumanError validateAmount(double amount, core::Allocator* allocator)
	{
		if (std::isfinite(amount) == false)
			return core::errf(allocator, "金額は数値で入力してください"_sv);
		if (amount < 0)
			return core::errf(allocator, "金額は0以上で入力してください: {}"_sv, amount);
		return {};
	}

	core::Result<double> parseAmount(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();
		if (trimmed.count() == 0)
			return core::errf(allocator, "金額が入力されていません"_sv);

		// from_chars does not accept a leading plus sign
		auto digits = trimmed;
		if (digits.count() > 1 && digits[0] == '+' && digits[1] != '-' && digits[1] != '+')
			digits = digits.sliceRight(1);

		double value = 0;
		auto [ptr, ec] = std::from_chars(digits.begin(), digits.end(), value);
		if (ec != std::errc{} || ptr != digits.end())
			return core::errf(allocator, "金額は数値で入力してください: '{}'"_sv, trimmed);

		if (auto err = validateAmount(value, allocator))
			return err;
		return value;
	}

	core::Result<core::String> parseSubject(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();
		if (trimmed.count() == 0)
			return core::errf(allocator, "科目が入力されていません"_sv);
		if (trimmed.isValidUtf8() == false)
			return core::errf(allocator, "科目の文字コードが正しくありません"_sv);
		return core::String{trimmed, allocator};
	}

	core::Result<NewEntry> parseEntry(
		core::StringView date,
		core::StringView category,
		core::StringView subject,
		core::StringView amount,
		core::Allocator* allocator
	)
	{
		auto dateResult = parseDate(date, allocator);
		if (dateResult.isError())
			return dateResult.releaseError();

		auto categoryResult = parseCategory(category, allocator);
		if (categoryResult.isError())
			return categoryResult.releaseError();

		auto subjectResult = parseSubject(subject, allocator);
		if (subjectResult.isError())
			return subjectResult.releaseError();

		auto amountResult = parseAmount(amount, allocator);
		if (amountResult.isError())
			return amountResult.releaseError();

		return NewEntry{
			.date = dateResult.releaseValue(),
			.category = categoryResult.releaseValue(),
			.subject = subjectResult.releaseValue(),
			.amount = amountResult.releaseValue(),
		};
	}

	core::StringView columnName(COLUMN column)
	{
		switch (column)
		{
		case COLUMN_DATE: return "date"_sv;
		case COLUMN_CATEGORY: return "category"_sv;
		case COLUMN_SUBJECT: return "subject"_sv;
		case COLUMN_AMOUNT: return "amount"_sv;
		default:
			core::unreachable();
			return {};
		}
	}

	core::Result<COLUMN> parseColumn(core::StringView text, core::Allocator* allocator)
	{
		auto trimmed = text.trim();
		for (auto column: {COLUMN_DATE, COLUMN_CATEGORY, COLUMN_SUBJECT, COLUMN_AMOUNT})
		{
			if (trimmed == columnName(column))
				return column;
		}
		return core::errf(allocator, "unknown column '{}', expected date, category, subject or amount"_sv, trimmed);
	}
}
