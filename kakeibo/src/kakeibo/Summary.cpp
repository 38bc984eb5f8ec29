#include "kakeibo/Summary.h"

namespace kakeibo
{
	core::String formatAmount(double amount, core::Allocator* allocator)
	{
		// fmt rounds half to even on the exact binary value like printf does
		auto digits = core::strf(allocator, "{:.0f}"_sv, amount);
		core::StringView view = digits;

		core::String res{allocator};
		if (view.startsWith("-"_sv))
		{
			view = view.sliceRight(1);
			// -0 is just 0
			if (view != "0"_sv)
				res.pushByte('-');
		}

		for (size_t i = 0; i < view.count(); ++i)
		{
			if (i > 0 && (view.count() - i) % 3 == 0)
				res.pushByte(',');
			res.pushByte(view[i]);
		}
		return res;
	}

	core::String summaryText(const MonthlySummary& summary, core::Allocator* allocator)
	{
		return core::strf(
			allocator,
			"【{}の集計結果】\n"
			"収入合計: {}\n"
			"支出合計: {}\n"
			"差引残高: {}\n"
			"件数: {}件"_sv,
			formatMonth(summary.month, allocator),
			formatAmount(summary.income, allocator),
			formatAmount(summary.expense, allocator),
			formatAmount(summary.net(), allocator),
			summary.count
		);
	}

	core::String statisticsText(const MonthlyStatistics& stats, core::Allocator* allocator)
	{
		auto res = core::strf(
			allocator,
			"【{}の詳細統計】\n"
			"\n"
			"基本情報:\n"
			"• 総レコード数: {}件\n"
			"• 収入件数: {}件\n"
			"• 支出件数: {}件\n"
			"\n"
			"収支情報:\n"
			"• 収入合計: ¥{}\n"
			"• 支出合計: ¥{}\n"
			"• 差引残高: ¥{}\n"
			"\n"
			"平均・最大・最小:\n"
			"• 平均収入: ¥{}\n"
			"• 平均支出: ¥{}\n"
			"• 最大収入: ¥{}\n"
			"• 最大支出: ¥{}\n"
			"• 最小収入: ¥{}\n"
			"• 最小支出: ¥{}\n"_sv,
			formatMonth(stats.month, allocator),
			stats.totalCount,
			stats.incomeCount,
			stats.expenseCount,
			formatAmount(stats.incomeTotal, allocator),
			formatAmount(stats.expenseTotal, allocator),
			formatAmount(stats.balance(), allocator),
			formatAmount(stats.averageIncome, allocator),
			formatAmount(stats.averageExpense, allocator),
			formatAmount(stats.maxIncome, allocator),
			formatAmount(stats.maxExpense, allocator),
			formatAmount(stats.minIncome, allocator),
			formatAmount(stats.minExpense, allocator)
		);

		if (stats.subjects.count() > 0)
		{
			res.push("\n科目別集計:\n"_sv);
			for (const auto& subject: stats.subjects)
				res.push(core::strf(allocator, "• {} {}: ¥{}\n"_sv, categoryName(subject.category), subject.subject, formatAmount(subject.amount, allocator)));
		}
		return res;
	}
}
