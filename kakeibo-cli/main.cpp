#include <core/Mallocator.h>
#include <core/Log.h>
#include <core/StringView.h>

#include <kakeibo/Args.h>
#include <kakeibo/Backup.h>
#include <kakeibo/Config.h>
#include <kakeibo/Exchange.h>
#include <kakeibo/Ledger.h>

#include <fmt/core.h>

#include <charconv>
#include <optional>

auto HELP = R"""(kakeibo-cli the cli interface for the kakeibo household ledger
kakeibo-cli [path/to/kakeibo.db] command [options]
the database defaults to KAKEIBO_DB or kakeibo.db next to the executable
GLOBAL OPTIONS:
  --log path/to/kakeibo.log, --backup-dir path/to/dir, --keep N
COMMANDS:
  help: prints this message
    - kakeibo-cli help
  init: creates a new ledger file
    - kakeibo-cli path/to/kakeibo.db init
  add: adds a new entry, the category is 収入 or 支出
    - kakeibo-cli path/to/kakeibo.db add -date 2024-01-15 -category 支出 -subject 食費 -amount 1500
  list: lists the entries, all of them or a single month's
    - kakeibo-cli path/to/kakeibo.db list [-month YYYY-MM]
  update: updates a single column of an entry, the column is date, category, subject or amount
    - kakeibo-cli path/to/kakeibo.db update -id 1 -column amount -value 2000
  delete: deletes an entry
    - kakeibo-cli path/to/kakeibo.db delete -id 1
  summary: prints the month's income, expense and balance
    - kakeibo-cli path/to/kakeibo.db summary -month YYYY-MM
  stats: prints the month's detailed statistics
    - kakeibo-cli path/to/kakeibo.db stats -month YYYY-MM
  months: lists the months with active or archived entries
    - kakeibo-cli path/to/kakeibo.db months
  export: writes every entry into a csv file
    - kakeibo-cli path/to/kakeibo.db export -file entries.csv
  import: reads entries from a csv file with date, category, subject and amount columns
    - kakeibo-cli path/to/kakeibo.db import -file entries.csv
  backup: copies the database file into the backup directory
    - kakeibo-cli path/to/kakeibo.db backup [-dir path/to/dir]
  backup-month: writes the month's entries into a csv file in the backup directory
    - kakeibo-cli path/to/kakeibo.db backup-month -month YYYY-MM [-dir path/to/dir]
  export-month: writes the month's statistics, subject totals and entries into three csv files
    - kakeibo-cli path/to/kakeibo.db export-month -month YYYY-MM -file stats.csv
  compare: writes a csv comparing the given months
    - kakeibo-cli path/to/kakeibo.db compare -months 2024-01,2024-02 -file compare.csv
  archive: moves the month's entries into the archive
    - kakeibo-cli path/to/kakeibo.db archive -month YYYY-MM
  restore: moves the month's archived entries back
    - kakeibo-cli path/to/kakeibo.db restore -month YYYY-MM
  cleanup: backs up and archives every month older than the newest N months
    - kakeibo-cli path/to/kakeibo.db cleanup [-keep N] [-dir path/to/dir]
)"""_sv;

static core::Result<int64_t> parseID(core::StringView text, core::Allocator* allocator)
{
	int64_t id = 0;
	auto res = std::from_chars(text.begin(), text.end(), id);
	if (res.ec != std::errc() || res.ptr != text.end() || id <= 0)
		return core::errf(allocator, "IDは正の整数で指定してください: '{}'"_sv, text);
	return id;
}

static void printEntries(const core::Array<kakeibo::Entry>& entries, core::Allocator* allocator)
{
	fmt::print("{:>6}  {}  {}  {}  {}\n", "ID", "日付      ", "区分", "科目", "金額");
	for (const auto& entry: entries)
	{
		fmt::print(
			"{:>6}  {}  {}  {}  {}\n",
			entry.id,
			kakeibo::formatDate(entry.date, allocator),
			kakeibo::categoryName(entry.category),
			entry.subject,
			kakeibo::formatAmount(entry.amount, allocator)
		);
	}
	fmt::print("{}件\n", entries.count());
}

int main(int argc, char** argv)
{
	core::Mallocator allocator{};
	core::Log log{&allocator};

	auto argsResult = kakeibo::Args::parse(argc, argv, {}, &allocator);
	if (argsResult.isError())
	{
		log.critical("failed to parse cli arguments, {}"_sv, argsResult.releaseError());
		return EXIT_FAILURE;
	}
	auto args = argsResult.releaseValue();

	auto configResult = kakeibo::Config::load(args, &allocator);
	if (configResult.isError())
	{
		log.critical("invalid configuration, {}"_sv, configResult.releaseError());
		return EXIT_FAILURE;
	}
	auto config = configResult.releaseValue();

	core::StringView command;
	if (args.positionals().count() >= 2)
	{
		config.dbPath = core::String{args.positional(0), &allocator};
		command = args.positional(1);
	}
	else if (args.positionals().count() == 1)
	{
		command = args.positional(0);
	}
	else
	{
		log.critical("no command found, run 'kakeibo-cli help'"_sv);
		return EXIT_FAILURE;
	}

	if (command == "help"_sv)
	{
		fmt::print("{}", HELP);
		return EXIT_SUCCESS;
	}

	if (auto logResult = core::Log::openFile(config.logPath, &allocator); logResult.isError())
		log.warn("logging to the console only, {}"_sv, logResult.error());
	else
		log = logResult.releaseValue();

	auto ledgerResult = kakeibo::Ledger::open(config.dbPath, &log, &allocator);
	if (ledgerResult.isError())
	{
		log.critical("failed to open ledger file, {}"_sv, ledgerResult.releaseError());
		return EXIT_FAILURE;
	}
	auto ledger = ledgerResult.releaseValue();

	auto loadMonth = [&](core::StringView text) -> core::Result<kakeibo::Month> {
		return kakeibo::parseMonth(text, &allocator);
	};

	auto backupDir = [&](core::StringView dir) -> core::StringView {
		if (dir.count() > 0)
			return dir;
		return config.backupDir;
	};

	if (command == "init"_sv)
	{
		log.info("ledger file {} is ready"_sv, config.dbPath);
		return EXIT_SUCCESS;
	}
	else if (command == "add"_sv)
	{
		core::StringView date, category, subject, amount;
		auto err = args.loadOptions({
			{"date"_sv, date, false},
			{"category"_sv, category},
			{"subject"_sv, subject},
			{"amount"_sv, amount},
		});
		if (err)
		{
			log.critical("failed to parse add command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto today = kakeibo::formatDate(kakeibo::today(), &allocator);
		if (date.count() == 0)
			date = today;

		auto entryResult = kakeibo::parseEntry(date, category, subject, amount, &allocator);
		if (entryResult.isError())
		{
			log.critical("{}"_sv, entryResult.releaseError());
			return EXIT_FAILURE;
		}
		auto entry = entryResult.releaseValue();

		auto idResult = ledger.addEntry(entry);
		if (idResult.isError())
		{
			log.critical("{}"_sv, idResult.releaseError());
			return EXIT_FAILURE;
		}

		fmt::print(
			"データを保存しました: ID={}, {} {} {} {}\n",
			idResult.value(),
			kakeibo::formatDate(entry.date, &allocator),
			kakeibo::categoryName(entry.category),
			entry.subject,
			kakeibo::formatAmount(entry.amount, &allocator)
		);
		return EXIT_SUCCESS;
	}
	else if (command == "list"_sv)
	{
		core::StringView month;
		auto err = args.loadOptions({
			{"month"_sv, month, false},
		});
		if (err)
		{
			log.critical("failed to parse list command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		std::optional<kakeibo::Month> filter;
		if (month.count() > 0)
		{
			auto monthResult = loadMonth(month);
			if (monthResult.isError())
			{
				log.critical("{}"_sv, monthResult.releaseError());
				return EXIT_FAILURE;
			}
			filter = monthResult.value();
		}

		auto entriesResult = filter ? ledger.entriesOfMonth(*filter) : ledger.entries();
		if (entriesResult.isError())
		{
			log.critical("{}"_sv, entriesResult.releaseError());
			return EXIT_FAILURE;
		}
		printEntries(entriesResult.value(), &allocator);
		return EXIT_SUCCESS;
	}
	else if (command == "update"_sv)
	{
		core::StringView id, column, value;
		auto err = args.loadOptions({
			{"id"_sv, id},
			{"column"_sv, column},
			{"value"_sv, value},
		});
		if (err)
		{
			log.critical("failed to parse update command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto idResult = parseID(id, &allocator);
		if (idResult.isError())
		{
			log.critical("{}"_sv, idResult.releaseError());
			return EXIT_FAILURE;
		}

		auto columnResult = kakeibo::parseColumn(column, &allocator);
		if (columnResult.isError())
		{
			log.critical("{}"_sv, columnResult.releaseError());
			return EXIT_FAILURE;
		}

		err = ledger.updateField(idResult.value(), columnResult.value(), value);
		if (err)
		{
			log.critical("{}"_sv, err);
			return EXIT_FAILURE;
		}

		fmt::print("データを更新しました: ID={}, {}={}\n", idResult.value(), column, value);
		return EXIT_SUCCESS;
	}
	else if (command == "delete"_sv)
	{
		core::StringView id;
		auto err = args.loadOptions({
			{"id"_sv, id},
		});
		if (err)
		{
			log.critical("failed to parse delete command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto idResult = parseID(id, &allocator);
		if (idResult.isError())
		{
			log.critical("{}"_sv, idResult.releaseError());
			return EXIT_FAILURE;
		}

		err = ledger.deleteEntry(idResult.value());
		if (err)
		{
			log.critical("{}"_sv, err);
			return EXIT_FAILURE;
		}

		fmt::print("データを削除しました: ID={}\n", idResult.value());
		return EXIT_SUCCESS;
	}
	else if (command == "summary"_sv || command == "stats"_sv)
	{
		core::StringView month;
		auto err = args.loadOptions({
			{"month"_sv, month},
		});
		if (err)
		{
			log.critical("failed to parse {} command arguments, {}"_sv, command, err);
			return EXIT_FAILURE;
		}

		auto monthResult = loadMonth(month);
		if (monthResult.isError())
		{
			log.critical("{}"_sv, monthResult.releaseError());
			return EXIT_FAILURE;
		}

		if (command == "summary"_sv)
		{
			auto summaryResult = ledger.monthlySummary(monthResult.value());
			if (summaryResult.isError())
			{
				log.critical("{}"_sv, summaryResult.releaseError());
				return EXIT_FAILURE;
			}

			auto summary = summaryResult.releaseValue();
			if (summary.has_value() == false)
			{
				fmt::print("{}のデータがありません\n", month);
				return EXIT_SUCCESS;
			}
			fmt::print("{}\n", kakeibo::summaryText(*summary, &allocator));
		}
		else
		{
			auto statsResult = ledger.monthlyStatistics(monthResult.value());
			if (statsResult.isError())
			{
				log.critical("{}"_sv, statsResult.releaseError());
				return EXIT_FAILURE;
			}

			auto stats = statsResult.releaseValue();
			if (stats.has_value() == false)
			{
				fmt::print("{}のデータがありません\n", month);
				return EXIT_SUCCESS;
			}
			fmt::print("{}\n", kakeibo::statisticsText(*stats, &allocator));
		}
		return EXIT_SUCCESS;
	}
	else if (command == "months"_sv)
	{
		auto monthsResult = ledger.availableMonths();
		if (monthsResult.isError())
		{
			log.critical("{}"_sv, monthsResult.releaseError());
			return EXIT_FAILURE;
		}

		for (auto month: monthsResult.value())
			fmt::print("{}\n", kakeibo::formatMonth(month, &allocator));
		return EXIT_SUCCESS;
	}
	else if (command == "export"_sv || command == "import"_sv)
	{
		core::StringView file;
		auto err = args.loadOptions({
			{"file"_sv, file},
		});
		if (err)
		{
			log.critical("failed to parse {} command arguments, {}"_sv, command, err);
			return EXIT_FAILURE;
		}

		if (command == "export"_sv)
		{
			auto countResult = kakeibo::exportEntries(ledger, file);
			if (countResult.isError())
			{
				log.critical("{}"_sv, countResult.releaseError());
				return EXIT_FAILURE;
			}
			fmt::print("CSVファイルにエクスポートしました: {} ({}件)\n", file, countResult.value());
		}
		else
		{
			auto reportResult = kakeibo::importEntries(ledger, file);
			if (reportResult.isError())
			{
				log.critical("{}"_sv, reportResult.releaseError());
				return EXIT_FAILURE;
			}
			fmt::print("{}\n", kakeibo::importReportText(reportResult.value(), &allocator));
		}
		return EXIT_SUCCESS;
	}
	else if (command == "backup"_sv)
	{
		core::StringView dir;
		auto err = args.loadOptions({
			{"dir"_sv, dir, false},
		});
		if (err)
		{
			log.critical("failed to parse backup command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto pathResult = kakeibo::backupDatabase(ledger, backupDir(dir), kakeibo::now());
		if (pathResult.isError())
		{
			log.critical("{}"_sv, pathResult.releaseError());
			return EXIT_FAILURE;
		}
		fmt::print("バックアップが成功しました。\nファイル名: {}\n", pathResult.value());
		return EXIT_SUCCESS;
	}
	else if (command == "backup-month"_sv || command == "archive"_sv || command == "restore"_sv)
	{
		core::StringView month, dir;
		auto err = args.loadOptions({
			{"month"_sv, month},
			{"dir"_sv, dir, false},
		});
		if (err)
		{
			log.critical("failed to parse {} command arguments, {}"_sv, command, err);
			return EXIT_FAILURE;
		}

		auto monthResult = loadMonth(month);
		if (monthResult.isError())
		{
			log.critical("{}"_sv, monthResult.releaseError());
			return EXIT_FAILURE;
		}

		if (command == "backup-month"_sv)
		{
			auto pathResult = kakeibo::backupMonth(ledger, monthResult.value(), backupDir(dir), kakeibo::now());
			if (pathResult.isError())
			{
				log.critical("{}"_sv, pathResult.releaseError());
				return EXIT_FAILURE;
			}
			fmt::print("{}のデータをバックアップしました\n{}\n", month, pathResult.value());
		}
		else if (command == "archive"_sv)
		{
			auto countResult = ledger.archiveMonth(monthResult.value(), kakeibo::today());
			if (countResult.isError())
			{
				log.critical("{}"_sv, countResult.releaseError());
				return EXIT_FAILURE;
			}
			fmt::print("{}のデータをアーカイブしました ({}件)\n", month, countResult.value());
		}
		else
		{
			auto countResult = ledger.restoreMonth(monthResult.value());
			if (countResult.isError())
			{
				log.critical("{}"_sv, countResult.releaseError());
				return EXIT_FAILURE;
			}
			fmt::print("{}のデータを復元しました ({}件)\n", month, countResult.value());
		}
		return EXIT_SUCCESS;
	}
	else if (command == "export-month"_sv)
	{
		core::StringView month, file;
		auto err = args.loadOptions({
			{"month"_sv, month},
			{"file"_sv, file},
		});
		if (err)
		{
			log.critical("failed to parse export-month command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto monthResult = loadMonth(month);
		if (monthResult.isError())
		{
			log.critical("{}"_sv, monthResult.releaseError());
			return EXIT_FAILURE;
		}

		auto filesResult = kakeibo::exportMonthlyStatistics(ledger, monthResult.value(), file);
		if (filesResult.isError())
		{
			log.critical("{}"_sv, filesResult.releaseError());
			return EXIT_FAILURE;
		}

		const auto& files = filesResult.value();
		fmt::print("月別集計データを出力しました:\n{}\n{}\n{}\n", files.summaryPath, files.subjectsPath, files.detailPath);
		return EXIT_SUCCESS;
	}
	else if (command == "compare"_sv)
	{
		core::StringView months, file;
		auto err = args.loadOptions({
			{"months"_sv, months},
			{"file"_sv, file},
		});
		if (err)
		{
			log.critical("failed to parse compare command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		core::Array<kakeibo::Month> parsedMonths{&allocator};
		for (auto text: months.split(","_sv, true, &allocator))
		{
			auto monthResult = loadMonth(text.trim());
			if (monthResult.isError())
			{
				log.critical("{}"_sv, monthResult.releaseError());
				return EXIT_FAILURE;
			}
			parsedMonths.push(monthResult.value());
		}

		auto countResult = kakeibo::exportMonthComparison(ledger, parsedMonths, file);
		if (countResult.isError())
		{
			log.critical("{}"_sv, countResult.releaseError());
			return EXIT_FAILURE;
		}
		fmt::print("複数月比較データを出力しました: {} ({}ヶ月)\n", file, countResult.value());
		return EXIT_SUCCESS;
	}
	else if (command == "cleanup"_sv)
	{
		core::StringView dir;
		auto err = args.loadOptions({
			{"dir"_sv, dir, false},
		});
		if (err)
		{
			log.critical("failed to parse cleanup command arguments, {}"_sv, err);
			return EXIT_FAILURE;
		}

		auto reportResult = kakeibo::cleanupOldData(ledger, config.monthsToKeep, backupDir(dir), kakeibo::now());
		if (reportResult.isError())
		{
			log.critical("{}"_sv, reportResult.releaseError());
			return EXIT_FAILURE;
		}

		const auto& report = reportResult.value();
		fmt::print("{}\n", kakeibo::cleanupReportText(report, &allocator));
		return report.failedMonths.count() > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
	}

	log.critical("unknown command '{}', run 'kakeibo-cli help'"_sv, command);
	return EXIT_FAILURE;
}
