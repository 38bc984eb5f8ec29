#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Date.h"
#include "kakeibo/Entry.h"

#include <core/Array.h>
#include <core/String.h>

namespace kakeibo
{
	struct MonthlySummary
	{
		Month month;
		double income = 0;
		double expense = 0;
		int64_t count = 0;

		double net() const { return income - expense; }
	};

	struct SubjectTotal
	{
		CATEGORY category;
		core::String subject;
		double amount;
	};

	struct MonthlyStatistics
	{
		Month month;
		int64_t totalCount = 0;
		int64_t incomeCount = 0;
		int64_t expenseCount = 0;
		double incomeTotal = 0;
		double expenseTotal = 0;
		// the following are 0 when the category has no entries
		double averageIncome = 0;
		double averageExpense = 0;
		double maxIncome = 0;
		double maxExpense = 0;
		double minIncome = 0;
		double minExpense = 0;
		// ordered by category then subject
		core::Array<SubjectTotal> subjects;

		explicit MonthlyStatistics(core::Allocator* allocator)
			: subjects(allocator)
		{}

		double balance() const { return incomeTotal - expenseTotal; }
	};

	// rounds to an integer and adds thousands separators, 1234567.4 -> 1,234,567
	KAKEIBO_EXPORT core::String formatAmount(double amount, core::Allocator* allocator);

	KAKEIBO_EXPORT core::String summaryText(const MonthlySummary& summary, core::Allocator* allocator);
	KAKEIBO_EXPORT core::String statisticsText(const MonthlyStatistics& stats, core::Allocator* allocator);
}
