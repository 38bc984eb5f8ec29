#include "kakeibo/Ledger.h"

namespace kakeibo
{
	namespace
	{
		int bindText(sqlite3_stmt* stmt, int index, core::StringView text)
		{
			// empty views may carry a null pointer which sqlite would bind as NULL
			auto ptr = text.count() > 0 ? text.data() : "";
			return sqlite3_bind_text(stmt, index, ptr, (int)text.count(), SQLITE_TRANSIENT);
		}

		core::StringView columnText(sqlite3_stmt* stmt, int index)
		{
			auto ptr = (const char*)sqlite3_column_text(stmt, index);
			if (ptr == nullptr)
				return {};
			return core::StringView{ptr, (size_t)sqlite3_column_bytes(stmt, index)};
		}
	}

	Ledger::Ledger(sqlite3* db, core::String path, core::Log* log, core::Allocator* allocator)
		: m_allocator(allocator),
		  m_log(log),
		  m_path(std::move(path)),
		  m_db(db)
	{}

	core::Result<sqlite3_stmt*> Ledger::createStmt(core::StringView query)
	{
		sqlite3_stmt* res = nullptr;
		auto rc = sqlite3_prepare_v3(m_db, query.data(), (int)query.count(), SQLITE_PREPARE_PERSISTENT, &res, nullptr);
		if (rc != SQLITE_OK)
			return core::errf(m_allocator, "sqlite3_prepare_v3 failed, {}, {}"_sv, sqlite3_errstr(rc), sqlite3_errmsg(m_db));
		return res;
	}

	core::HumanError Ledger::sqlError(core::StringView action, int rc)
	{
		return core::errf(m_allocator, "failed to {}, {} ({})"_sv, action, sqlite3_errmsg(m_db), sqlite3_errstr(rc));
	}

	core::HumanError Ledger::step(STMT stmt, core::StringView action)
	{
		auto rc = sqlite3_step(m_stmts[stmt]);
		auto err = rc == SQLITE_DONE ? core::HumanError{} : sqlError(action, rc);
		sqlite3_reset(m_stmts[stmt]);
		return err;
	}

	core::HumanError Ledger::begin()
	{
		return step(STMT_BEGIN, "begin transaction"_sv);
	}

	core::HumanError Ledger::commit()
	{
		return step(STMT_COMMIT, "commit transaction"_sv);
	}

	void Ledger::rollback()
	{
		if (auto err = step(STMT_ROLLBACK, "rollback transaction"_sv))
			m_log->error("{}"_sv, err);
	}

	core::Result<Ledger> Ledger::open(core::StringView path, core::Log* log, core::Allocator* allocator)
	{
		sqlite3* db = nullptr;

		auto cPath = core::String{path, allocator};
		auto rc = sqlite3_open_v2(
			cPath.c_str(),
			&db,
			SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
			nullptr);
		if (rc != SQLITE_OK)
		{
			// sqlite allocates the handle even on failure
			auto err = core::errf(allocator, "failed to open sqlite3 database '{}', {}"_sv, path, sqlite3_errstr(rc));
			sqlite3_close_v2(db);
			return err;
		}
		auto ledger = Ledger{db, std::move(cPath), log, allocator};

		struct SQLStmt
		{
			sqlite3_stmt*& stmt;
			core::StringView query;
		};

		SQLStmt versionStmts[] = {
			SQLStmt{ledger.m_stmts[STMT_GET_APP_ID], "PRAGMA application_id"_sv},
			SQLStmt{ledger.m_stmts[STMT_GET_USER_VERSION], "PRAGMA user_version"_sv},
		};

		for (auto s: versionStmts)
		{
			auto res = ledger.createStmt(s.query);
			if (res.isError())
				return res.releaseError();
			s.stmt = res.releaseValue();
		}

		auto versionResult = ledger.queryVersion();
		if (versionResult.isError())
			return versionResult.releaseError();
		auto version = versionResult.releaseValue();

		if (version.appID != 0 && version.appID != VERSION.appID)
			return core::errf(allocator, "'{}' is not a kakeibo database, application_id = {:#x}"_sv, path, version.appID);

		if (version.appID == VERSION.appID && version.userVersion > VERSION.userVersion)
			return core::errf(allocator, "'{}' was created by a newer version, user_version = {}"_sv, path, version.userVersion);

		// files without an application id are either new or were created by the older
		// scripted app which only had the kakeibo table, both are completed here
		auto initQuery = core::strf(allocator, R"QUERY(
			PRAGMA application_id = {};
			PRAGMA user_version = {};

			CREATE TABLE IF NOT EXISTS kakeibo (
				id INTEGER PRIMARY KEY AUTOINCREMENT,
				date TEXT NOT NULL,
				category TEXT NOT NULL,
				subject TEXT NOT NULL,
				amount REAL NOT NULL
			);

			CREATE TABLE IF NOT EXISTS kakeibo_archive (
				id INTEGER PRIMARY KEY AUTOINCREMENT,
				original_id INTEGER,
				date TEXT NOT NULL,
				category TEXT NOT NULL,
				subject TEXT NOT NULL,
				amount REAL NOT NULL,
				archived_date TEXT NOT NULL
			);
		)QUERY"_sv, VERSION.appID, VERSION.userVersion);

		char* sqlerr = nullptr;
		rc = sqlite3_exec(ledger.m_db, initQuery.c_str(), nullptr, nullptr, &sqlerr);
		if (rc != SQLITE_OK)
		{
			auto err = core::errf(allocator, "failed to init sqlite3 database, {}"_sv, sqlerr ? sqlerr : sqlite3_errstr(rc));
			sqlite3_free(sqlerr);
			return err;
		}

		// rows with an unknown category or an impossible date (legacy files may have them)
		// are invisible to every read, aggregate and archive query through this view,
		// date() normalizes 2024-02-30 to 2024-03-01 so the comparison rejects it
		auto viewQuery = core::strf(allocator, R"QUERY(
			CREATE TEMP VIEW IF NOT EXISTS kakeibo_valid AS
			SELECT id, date, category, subject, amount FROM main.kakeibo
			WHERE category IN ('{}', '{}') AND date(date) IS date;
		)QUERY"_sv, categoryName(CATEGORY_INCOME), categoryName(CATEGORY_EXPENSE));

		rc = sqlite3_exec(ledger.m_db, viewQuery.c_str(), nullptr, nullptr, &sqlerr);
		if (rc != SQLITE_OK)
		{
			auto err = core::errf(allocator, "failed to init sqlite3 database, {}"_sv, sqlerr ? sqlerr : sqlite3_errstr(rc));
			sqlite3_free(sqlerr);
			return err;
		}

		SQLStmt stmts[] = {
			SQLStmt{ledger.m_stmts[STMT_BEGIN], "BEGIN IMMEDIATE"_sv},
			SQLStmt{ledger.m_stmts[STMT_COMMIT], "COMMIT"_sv},
			SQLStmt{ledger.m_stmts[STMT_ROLLBACK], "ROLLBACK"_sv},
			SQLStmt{ledger.m_stmts[STMT_INSERT_ENTRY], R"QUERY(
				INSERT INTO kakeibo(date, category, subject, amount) VALUES(?1, ?2, ?3, ?4)
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_UPDATE_ENTRY], R"QUERY(
				UPDATE kakeibo SET date = ?2, category = ?3, subject = ?4, amount = ?5 WHERE id = ?1
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_UPDATE_DATE], "UPDATE kakeibo SET date = ?2 WHERE id = ?1"_sv},
			SQLStmt{ledger.m_stmts[STMT_UPDATE_CATEGORY], "UPDATE kakeibo SET category = ?2 WHERE id = ?1"_sv},
			SQLStmt{ledger.m_stmts[STMT_UPDATE_SUBJECT], "UPDATE kakeibo SET subject = ?2 WHERE id = ?1"_sv},
			SQLStmt{ledger.m_stmts[STMT_UPDATE_AMOUNT], "UPDATE kakeibo SET amount = ?2 WHERE id = ?1"_sv},
			SQLStmt{ledger.m_stmts[STMT_DELETE_ENTRY], "DELETE FROM kakeibo WHERE id = ?1"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_ENTRIES], R"QUERY(
				SELECT id, date, category, subject, amount FROM kakeibo_valid ORDER BY date, id
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_ENTRIES_OF_MONTH], R"QUERY(
				SELECT id, date, category, subject, amount FROM kakeibo_valid
				WHERE substr(date, 1, 7) = ?1
				ORDER BY date, id
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_MONTHLY_SUMMARY], R"QUERY(
				SELECT
					substr(date, 1, 7) AS month,
					COALESCE(SUM(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(SUM(CASE WHEN category = ?2 THEN amount END), 0),
					COUNT(*)
				FROM kakeibo_valid
				WHERE substr(date, 1, 7) = ?3
				GROUP BY month
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_MONTHLY_SUMMARIES], R"QUERY(
				SELECT
					substr(date, 1, 7) AS month,
					COALESCE(SUM(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(SUM(CASE WHEN category = ?2 THEN amount END), 0),
					COUNT(*)
				FROM kakeibo_valid
				GROUP BY month
				ORDER BY month
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_MONTHLY_STATISTICS], R"QUERY(
				SELECT
					COUNT(*),
					COUNT(CASE WHEN category = ?1 THEN 1 END),
					COUNT(CASE WHEN category = ?2 THEN 1 END),
					COALESCE(SUM(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(SUM(CASE WHEN category = ?2 THEN amount END), 0),
					COALESCE(AVG(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(AVG(CASE WHEN category = ?2 THEN amount END), 0),
					COALESCE(MAX(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(MAX(CASE WHEN category = ?2 THEN amount END), 0),
					COALESCE(MIN(CASE WHEN category = ?1 THEN amount END), 0),
					COALESCE(MIN(CASE WHEN category = ?2 THEN amount END), 0)
				FROM kakeibo_valid
				WHERE substr(date, 1, 7) = ?3
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_SUBJECT_TOTALS], R"QUERY(
				SELECT category, subject, SUM(amount) FROM kakeibo_valid
				WHERE substr(date, 1, 7) = ?1
				GROUP BY category, subject
				ORDER BY category, subject
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_AVAILABLE_MONTHS], R"QUERY(
				SELECT substr(date, 1, 7) AS month FROM kakeibo_valid
				UNION
				SELECT substr(date, 1, 7) AS month FROM kakeibo_archive
				ORDER BY month DESC
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_SELECT_ACTIVE_MONTHS], R"QUERY(
				SELECT DISTINCT substr(date, 1, 7) AS month FROM kakeibo_valid ORDER BY month DESC
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_ARCHIVE_MONTH], R"QUERY(
				INSERT INTO kakeibo_archive(original_id, date, category, subject, amount, archived_date)
				SELECT id, date, category, subject, amount, ?2 FROM kakeibo_valid
				WHERE substr(date, 1, 7) = ?1
				ORDER BY id
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_DELETE_MONTH], R"QUERY(
				DELETE FROM kakeibo WHERE id IN (SELECT id FROM kakeibo_valid WHERE substr(date, 1, 7) = ?1)
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_RESTORE_MONTH], R"QUERY(
				INSERT INTO kakeibo(date, category, subject, amount)
				SELECT date, category, subject, amount FROM kakeibo_archive
				WHERE substr(date, 1, 7) = ?1
				ORDER BY id
			)QUERY"_sv},
			SQLStmt{ledger.m_stmts[STMT_DELETE_ARCHIVED_MONTH], "DELETE FROM kakeibo_archive WHERE substr(date, 1, 7) = ?1"_sv},
		};

		for (auto s: stmts)
		{
			auto res = ledger.createStmt(s.query);
			if (res.isError())
				return res.releaseError();
			s.stmt = res.releaseValue();
		}

		auto invalidResult = ledger.createStmt(R"QUERY(
			SELECT COUNT(*) FROM kakeibo WHERE id NOT IN (SELECT id FROM kakeibo_valid)
		)QUERY"_sv);
		if (invalidResult.isError())
			return invalidResult.releaseError();
		auto invalidStmt = invalidResult.releaseValue();
		rc = sqlite3_step(invalidStmt);
		if (rc != SQLITE_ROW)
		{
			auto err = ledger.sqlError("count invalid entries"_sv, rc);
			sqlite3_finalize(invalidStmt);
			return err;
		}
		auto invalidCount = sqlite3_column_int64(invalidStmt, 0);
		sqlite3_finalize(invalidStmt);
		if (invalidCount > 0)
			log->warn("'{}' has {} entries with an invalid date or category, they are ignored"_sv, path, invalidCount);

		log->debug("opened ledger '{}'"_sv, path);
		return ledger;
	}

	core::Result<Ledger::Version> Ledger::queryVersion()
	{
		auto appIDStmt = m_stmts[STMT_GET_APP_ID];
		auto rc = sqlite3_step(appIDStmt);
		if (rc != SQLITE_ROW)
		{
			auto err = sqlError("query application_id"_sv, rc);
			sqlite3_reset(appIDStmt);
			return err;
		}
		auto appID = sqlite3_column_int(appIDStmt, 0);
		sqlite3_reset(appIDStmt);

		auto userVersionStmt = m_stmts[STMT_GET_USER_VERSION];
		rc = sqlite3_step(userVersionStmt);
		if (rc != SQLITE_ROW)
		{
			auto err = sqlError("query user_version"_sv, rc);
			sqlite3_reset(userVersionStmt);
			return err;
		}
		auto userVersion = sqlite3_column_int(userVersionStmt, 0);
		sqlite3_reset(userVersionStmt);

		return Ledger::Version{
			.appID = appID,
			.userVersion = userVersion,
		};
	}

	core::HumanError Ledger::insertEntry(const NewEntry& entry)
	{
		if (auto err = validateAmount(entry.amount, m_allocator))
			return err;
		if (entry.date.ok() == false)
			return core::errf(m_allocator, "存在しない日付です"_sv);

		auto stmt = m_stmts[STMT_INSERT_ENTRY];
		auto date = formatDate(entry.date, m_allocator);

		auto rc = bindText(stmt, 1, date);
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 2, categoryName(entry.category));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 3, entry.subject);
		if (rc == SQLITE_OK)
			rc = sqlite3_bind_double(stmt, 4, entry.amount);
		if (rc != SQLITE_OK)
			return sqlError("bind entry"_sv, rc);

		return step(STMT_INSERT_ENTRY, "add entry"_sv);
	}

	core::Result<int64_t> Ledger::addEntry(const NewEntry& entry)
	{
		if (auto err = insertEntry(entry))
			return err;

		auto id = (int64_t)sqlite3_last_insert_rowid(m_db);
		m_log->info("新規レコード追加: ID={}, 日付={}, 区分={}, 科目={}, 金額={}"_sv,
			id, formatDate(entry.date, m_allocator), categoryName(entry.category), entry.subject, entry.amount);
		return id;
	}

	core::HumanError Ledger::updateEntry(const Entry& entry)
	{
		if (auto err = validateAmount(entry.amount, m_allocator))
			return err;
		if (entry.date.ok() == false)
			return core::errf(m_allocator, "存在しない日付です"_sv);

		auto stmt = m_stmts[STMT_UPDATE_ENTRY];
		auto date = formatDate(entry.date, m_allocator);

		auto rc = sqlite3_bind_int64(stmt, 1, entry.id);
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 2, date);
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 3, categoryName(entry.category));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 4, entry.subject);
		if (rc == SQLITE_OK)
			rc = sqlite3_bind_double(stmt, 5, entry.amount);
		if (rc != SQLITE_OK)
			return sqlError("bind entry"_sv, rc);

		if (auto err = step(STMT_UPDATE_ENTRY, "update entry"_sv))
			return err;

		if (sqlite3_changes(m_db) == 0)
			return core::errf(m_allocator, "ID={} のレコードが見つかりません"_sv, entry.id);

		m_log->info("レコード更新: ID={}, 日付={}, 区分={}, 科目={}, 金額={}"_sv,
			entry.id, date, categoryName(entry.category), entry.subject, entry.amount);
		return {};
	}

	core::HumanError Ledger::updateField(int64_t id, COLUMN column, core::StringView text)
	{
		STMT stmtKind = STMT_COUNT;
		core::String value{m_allocator};
		double amount = 0;

		switch (column)
		{
		case COLUMN_DATE:
		{
			auto dateResult = parseDate(text, m_allocator);
			if (dateResult.isError())
				return dateResult.releaseError();
			value = formatDate(dateResult.value(), m_allocator);
			stmtKind = STMT_UPDATE_DATE;
			break;
		}
		case COLUMN_CATEGORY:
		{
			auto categoryResult = parseCategory(text, m_allocator);
			if (categoryResult.isError())
				return categoryResult.releaseError();
			value = categoryName(categoryResult.value());
			stmtKind = STMT_UPDATE_CATEGORY;
			break;
		}
		case COLUMN_SUBJECT:
		{
			auto subjectResult = parseSubject(text, m_allocator);
			if (subjectResult.isError())
				return subjectResult.releaseError();
			value = subjectResult.releaseValue();
			stmtKind = STMT_UPDATE_SUBJECT;
			break;
		}
		case COLUMN_AMOUNT:
		{
			auto amountResult = parseAmount(text, m_allocator);
			if (amountResult.isError())
				return amountResult.releaseError();
			amount = amountResult.value();
			stmtKind = STMT_UPDATE_AMOUNT;
			break;
		}
		default:
			core::unreachable();
			return core::errf(m_allocator, "unknown column"_sv);
		}

		auto stmt = m_stmts[stmtKind];
		auto rc = sqlite3_bind_int64(stmt, 1, id);
		if (rc == SQLITE_OK)
		{
			if (column == COLUMN_AMOUNT)
				rc = sqlite3_bind_double(stmt, 2, amount);
			else
				rc = bindText(stmt, 2, value);
		}
		if (rc != SQLITE_OK)
			return sqlError("bind field"_sv, rc);

		if (auto err = step(stmtKind, "update field"_sv))
			return err;

		if (sqlite3_changes(m_db) == 0)
			return core::errf(m_allocator, "ID={} のレコードが見つかりません"_sv, id);

		if (column == COLUMN_AMOUNT)
			m_log->info("レコード更新: ID={}, 列={}, 値={}"_sv, id, columnName(column), amount);
		else
			m_log->info("レコード更新: ID={}, 列={}, 値={}"_sv, id, columnName(column), value);
		return {};
	}

	core::HumanError Ledger::deleteEntry(int64_t id)
	{
		auto rc = sqlite3_bind_int64(m_stmts[STMT_DELETE_ENTRY], 1, id);
		if (rc != SQLITE_OK)
			return sqlError("bind id"_sv, rc);

		if (auto err = step(STMT_DELETE_ENTRY, "delete entry"_sv))
			return err;

		if (sqlite3_changes(m_db) == 0)
			return core::errf(m_allocator, "ID={} のレコードが見つかりません"_sv, id);

		m_log->info("レコード削除: ID={}"_sv, id);
		return {};
	}

	core::HumanError Ledger::insertEntries(const core::Array<NewEntry>& entries)
	{
		if (auto err = begin())
			return err;

		for (const auto& entry: entries)
		{
			if (auto err = insertEntry(entry))
			{
				rollback();
				return err;
			}
		}

		if (auto err = commit())
		{
			rollback();
			return err;
		}

		m_log->info("{}件のレコードを一括追加しました"_sv, entries.count());
		return {};
	}

	core::Result<core::Array<Entry>> Ledger::readEntries(sqlite3_stmt* stmt, core::StringView action)
	{
		core::Array<Entry> res{m_allocator};
		while (true)
		{
			auto rc = sqlite3_step(stmt);
			if (rc == SQLITE_DONE)
				break;

			if (rc != SQLITE_ROW)
			{
				auto err = sqlError(action, rc);
				sqlite3_reset(stmt);
				return err;
			}

			auto id = (int64_t)sqlite3_column_int64(stmt, 0);
			auto dateText = columnText(stmt, 1);
			auto categoryText = columnText(stmt, 2);

			// rows written by other tools may hold anything, skip what can't be represented
			auto dateResult = parseDate(dateText, m_allocator);
			if (dateResult.isError())
			{
				m_log->warn("skipping entry ID={}, {}"_sv, id, dateResult.error());
				continue;
			}

			auto categoryResult = parseCategory(categoryText, m_allocator);
			if (categoryResult.isError())
			{
				m_log->warn("skipping entry ID={}, {}"_sv, id, categoryResult.error());
				continue;
			}

			res.push(Entry{
				.id = id,
				.date = dateResult.releaseValue(),
				.category = categoryResult.releaseValue(),
				.subject = core::String{columnText(stmt, 3), m_allocator},
				.amount = sqlite3_column_double(stmt, 4),
			});
		}
		sqlite3_reset(stmt);
		return res;
	}

	core::Result<core::Array<Month>> Ledger::readMonths(sqlite3_stmt* stmt, core::StringView action)
	{
		core::Array<Month> res{m_allocator};
		while (true)
		{
			auto rc = sqlite3_step(stmt);
			if (rc == SQLITE_DONE)
				break;

			if (rc != SQLITE_ROW)
			{
				auto err = sqlError(action, rc);
				sqlite3_reset(stmt);
				return err;
			}

			auto monthText = columnText(stmt, 0);
			auto monthResult = parseMonth(monthText, m_allocator);
			if (monthResult.isError())
			{
				m_log->warn("skipping month '{}', {}"_sv, monthText, monthResult.error());
				continue;
			}
			res.push(monthResult.releaseValue());
		}
		sqlite3_reset(stmt);
		return res;
	}

	core::Result<core::Array<Entry>> Ledger::entries()
	{
		return readEntries(m_stmts[STMT_SELECT_ENTRIES], "list entries"_sv);
	}

	core::Result<core::Array<Entry>> Ledger::entriesOfMonth(Month month)
	{
		auto stmt = m_stmts[STMT_SELECT_ENTRIES_OF_MONTH];
		auto monthText = formatMonth(month, m_allocator);
		auto rc = bindText(stmt, 1, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		auto res = readEntries(stmt, "list entries of month"_sv);
		if (res.isValue())
			m_log->debug("月別データ取得: {}, 件数: {}"_sv, monthText, res.value().count());
		return res;
	}

	core::Result<std::optional<MonthlySummary>> Ledger::monthlySummary(Month month)
	{
		auto stmt = m_stmts[STMT_SELECT_MONTHLY_SUMMARY];
		auto monthText = formatMonth(month, m_allocator);
		auto rc = bindText(stmt, 1, categoryName(CATEGORY_INCOME));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 2, categoryName(CATEGORY_EXPENSE));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 3, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		rc = sqlite3_step(stmt);
		if (rc == SQLITE_DONE)
		{
			sqlite3_reset(stmt);
			return std::optional<MonthlySummary>{};
		}

		if (rc != SQLITE_ROW)
		{
			auto err = sqlError("summarize month"_sv, rc);
			sqlite3_reset(stmt);
			return err;
		}

		MonthlySummary summary{
			.month = month,
			.income = sqlite3_column_double(stmt, 1),
			.expense = sqlite3_column_double(stmt, 2),
			.count = (int64_t)sqlite3_column_int64(stmt, 3),
		};
		sqlite3_reset(stmt);

		m_log->info("月次集計実施: {}, 収入={}, 支出={}"_sv, monthText, summary.income, summary.expense);
		return std::optional<MonthlySummary>{summary};
	}

	core::Result<core::Array<MonthlySummary>> Ledger::monthlySummaries()
	{
		auto stmt = m_stmts[STMT_SELECT_MONTHLY_SUMMARIES];
		auto rc = bindText(stmt, 1, categoryName(CATEGORY_INCOME));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 2, categoryName(CATEGORY_EXPENSE));
		if (rc != SQLITE_OK)
			return sqlError("bind categories"_sv, rc);

		core::Array<MonthlySummary> res{m_allocator};
		while (true)
		{
			rc = sqlite3_step(stmt);
			if (rc == SQLITE_DONE)
				break;

			if (rc != SQLITE_ROW)
			{
				auto err = sqlError("summarize months"_sv, rc);
				sqlite3_reset(stmt);
				return err;
			}

			auto monthText = columnText(stmt, 0);
			auto monthResult = parseMonth(monthText, m_allocator);
			if (monthResult.isError())
			{
				m_log->warn("skipping month '{}', {}"_sv, monthText, monthResult.error());
				continue;
			}

			res.push(MonthlySummary{
				.month = monthResult.releaseValue(),
				.income = sqlite3_column_double(stmt, 1),
				.expense = sqlite3_column_double(stmt, 2),
				.count = (int64_t)sqlite3_column_int64(stmt, 3),
			});
		}
		sqlite3_reset(stmt);
		return res;
	}

	core::Result<std::optional<MonthlyStatistics>> Ledger::monthlyStatistics(Month month)
	{
		auto monthText = formatMonth(month, m_allocator);

		auto stmt = m_stmts[STMT_SELECT_MONTHLY_STATISTICS];
		auto rc = bindText(stmt, 1, categoryName(CATEGORY_INCOME));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 2, categoryName(CATEGORY_EXPENSE));
		if (rc == SQLITE_OK)
			rc = bindText(stmt, 3, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		rc = sqlite3_step(stmt);
		if (rc != SQLITE_ROW)
		{
			auto err = sqlError("query month statistics"_sv, rc);
			sqlite3_reset(stmt);
			return err;
		}

		MonthlyStatistics stats{m_allocator};
		stats.month = month;
		stats.totalCount = sqlite3_column_int64(stmt, 0);
		stats.incomeCount = sqlite3_column_int64(stmt, 1);
		stats.expenseCount = sqlite3_column_int64(stmt, 2);
		stats.incomeTotal = sqlite3_column_double(stmt, 3);
		stats.expenseTotal = sqlite3_column_double(stmt, 4);
		stats.averageIncome = sqlite3_column_double(stmt, 5);
		stats.averageExpense = sqlite3_column_double(stmt, 6);
		stats.maxIncome = sqlite3_column_double(stmt, 7);
		stats.maxExpense = sqlite3_column_double(stmt, 8);
		stats.minIncome = sqlite3_column_double(stmt, 9);
		stats.minExpense = sqlite3_column_double(stmt, 10);
		sqlite3_reset(stmt);

		if (stats.totalCount == 0)
			return std::optional<MonthlyStatistics>{};

		stmt = m_stmts[STMT_SELECT_SUBJECT_TOTALS];
		rc = bindText(stmt, 1, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		while (true)
		{
			rc = sqlite3_step(stmt);
			if (rc == SQLITE_DONE)
				break;

			if (rc != SQLITE_ROW)
			{
				auto err = sqlError("query subject totals"_sv, rc);
				sqlite3_reset(stmt);
				return err;
			}

			auto categoryResult = parseCategory(columnText(stmt, 0), m_allocator);
			if (categoryResult.isError())
			{
				m_log->warn("skipping subject total, {}"_sv, categoryResult.error());
				continue;
			}

			stats.subjects.push(SubjectTotal{
				.category = categoryResult.releaseValue(),
				.subject = core::String{columnText(stmt, 1), m_allocator},
				.amount = sqlite3_column_double(stmt, 2),
			});
		}
		sqlite3_reset(stmt);

		m_log->debug("月別統計取得: {}"_sv, monthText);
		return std::optional<MonthlyStatistics>{std::move(stats)};
	}

	core::Result<core::Array<Month>> Ledger::availableMonths()
	{
		return readMonths(m_stmts[STMT_SELECT_AVAILABLE_MONTHS], "list available months"_sv);
	}

	core::Result<core::Array<Month>> Ledger::activeMonths()
	{
		return readMonths(m_stmts[STMT_SELECT_ACTIVE_MONTHS], "list active months"_sv);
	}

	core::Result<int64_t> Ledger::archiveMonth(Month month, Date archivedDate)
	{
		auto monthText = formatMonth(month, m_allocator);
		auto dateText = formatDate(archivedDate, m_allocator);

		auto rc = bindText(m_stmts[STMT_ARCHIVE_MONTH], 1, monthText);
		if (rc == SQLITE_OK)
			rc = bindText(m_stmts[STMT_ARCHIVE_MONTH], 2, dateText);
		if (rc == SQLITE_OK)
			rc = bindText(m_stmts[STMT_DELETE_MONTH], 1, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		if (auto err = begin())
			return err;

		if (auto err = step(STMT_ARCHIVE_MONTH, "copy month into archive"_sv))
		{
			rollback();
			return err;
		}

		if (auto err = step(STMT_DELETE_MONTH, "delete archived month"_sv))
		{
			rollback();
			return err;
		}
		auto count = (int64_t)sqlite3_changes(m_db);

		if (auto err = commit())
		{
			rollback();
			return err;
		}

		m_log->info("月別アーカイブ成功: {}, 件数: {}"_sv, monthText, count);
		return count;
	}

	core::Result<int64_t> Ledger::restoreMonth(Month month)
	{
		auto monthText = formatMonth(month, m_allocator);

		auto rc = bindText(m_stmts[STMT_RESTORE_MONTH], 1, monthText);
		if (rc == SQLITE_OK)
			rc = bindText(m_stmts[STMT_DELETE_ARCHIVED_MONTH], 1, monthText);
		if (rc != SQLITE_OK)
			return sqlError("bind month"_sv, rc);

		if (auto err = begin())
			return err;

		if (auto err = step(STMT_RESTORE_MONTH, "restore archived month"_sv))
		{
			rollback();
			return err;
		}
		auto count = (int64_t)sqlite3_changes(m_db);

		if (auto err = step(STMT_DELETE_ARCHIVED_MONTH, "delete restored month from archive"_sv))
		{
			rollback();
			return err;
		}

		if (auto err = commit())
		{
			rollback();
			return err;
		}

		m_log->info("月別復元成功: {}, 件数: {}"_sv, monthText, count);
		return count;
	}
}
