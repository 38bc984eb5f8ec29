#pragma once

#include "kakeibo/Exports.h"
#include "kakeibo/Date.h"
#include "kakeibo/Entry.h"
#include "kakeibo/Summary.h"

#include <core/Array.h>
#include <core/Log.h>
#include <core/Result.h>
#include <core/StringView.h>

#include <sqlite3.h>

#include <optional>

namespace kakeibo
{
	// household ledger stored in a sqlite3 file, tables kakeibo and kakeibo_archive
	class Ledger
	{
		enum STMT
		{
			STMT_GET_APP_ID,
			STMT_GET_USER_VERSION,
			STMT_BEGIN,
			STMT_COMMIT,
			STMT_ROLLBACK,
			STMT_INSERT_ENTRY,
			STMT_UPDATE_ENTRY,
			STMT_UPDATE_DATE,
			STMT_UPDATE_CATEGORY,
			STMT_UPDATE_SUBJECT,
			STMT_UPDATE_AMOUNT,
			STMT_DELETE_ENTRY,
			STMT_SELECT_ENTRIES,
			STMT_SELECT_ENTRIES_OF_MONTH,
			STMT_SELECT_MONTHLY_SUMMARY,
			STMT_SELECT_MONTHLY_SUMMARIES,
			STMT_SELECT_MONTHLY_STATISTICS,
			STMT_SELECT_SUBJECT_TOTALS,
			STMT_SELECT_AVAILABLE_MONTHS,
			STMT_SELECT_ACTIVE_MONTHS,
			STMT_ARCHIVE_MONTH,
			STMT_DELETE_MONTH,
			STMT_RESTORE_MONTH,
			STMT_DELETE_ARCHIVED_MONTH,
			STMT_COUNT,
		};

		core::Allocator* m_allocator = nullptr;
		core::Log* m_log = nullptr;
		core::String m_path;
		sqlite3* m_db = nullptr;
		sqlite3_stmt* m_stmts[STMT_COUNT] = {};

		void destroy()
		{
			for (auto& stmt: m_stmts)
			{
				if (stmt)
				{
					sqlite3_finalize(stmt);
					stmt = nullptr;
				}
			}

			if (m_db)
			{
				sqlite3_close_v2(m_db);
				m_db = nullptr;
			}
		}

		void moveFrom(Ledger&& other)
		{
			m_allocator = other.m_allocator;
			m_log = other.m_log;
			m_path = std::move(other.m_path);
			m_db = other.m_db;
			for (size_t i = 0; i < STMT_COUNT; ++i)
			{
				m_stmts[i] = other.m_stmts[i];
				other.m_stmts[i] = nullptr;
			}

			other.m_allocator = nullptr;
			other.m_log = nullptr;
			other.m_db = nullptr;
		}

		Ledger(sqlite3* db, core::String path, core::Log* log, core::Allocator* allocator);

		core::Result<sqlite3_stmt*> createStmt(core::StringView query);
		core::HumanError sqlError(core::StringView action, int rc);
		core::HumanError step(STMT stmt, core::StringView action);

		core::HumanError begin();
		core::HumanError commit();
		void rollback();

		core::HumanError insertEntry(const NewEntry& entry);
		core::Result<core::Array<Entry>> readEntries(sqlite3_stmt* stmt, core::StringView action);
		core::Result<core::Array<Month>> readMonths(sqlite3_stmt* stmt, core::StringView action);

	public:
		struct Version
		{
			int32_t appID;
			int32_t userVersion;
		};

		static constexpr Version VERSION{
			.appID = 0x4B4B4250,
			.userVersion = 1,
		};

		// opens or creates the ledger file, the log must outlive the ledger
		KAKEIBO_EXPORT static core::Result<Ledger> open(core::StringView path, core::Log* log, core::Allocator* allocator);

		Ledger(const Ledger&) = delete;
		Ledger& operator=(const Ledger&) = delete;

		Ledger(Ledger&& other) noexcept
			: m_path(other.m_allocator)
		{
			moveFrom(std::move(other));
		}

		Ledger& operator=(Ledger&& other) noexcept
		{
			destroy();
			moveFrom(std::move(other));
			return *this;
		}

		~Ledger() noexcept
		{
			destroy();
		}

		core::StringView path() const { return m_path; }
		core::Log* log() const { return m_log; }
		core::Allocator* allocator() const { return m_allocator; }

		KAKEIBO_EXPORT core::Result<Version> queryVersion();

		KAKEIBO_EXPORT core::Result<int64_t> addEntry(const NewEntry& entry);
		// fails when no entry has the given id
		KAKEIBO_EXPORT core::HumanError updateEntry(const Entry& entry);
		// validates the text for the given column and writes it only when it's valid
		KAKEIBO_EXPORT core::HumanError updateField(int64_t id, COLUMN column, core::StringView text);
		KAKEIBO_EXPORT core::HumanError deleteEntry(int64_t id);
		// all inserted in one transaction, nothing is inserted on failure
		KAKEIBO_EXPORT core::HumanError insertEntries(const core::Array<NewEntry>& entries);

		// ordered by date then id
		KAKEIBO_EXPORT core::Result<core::Array<Entry>> entries();
		KAKEIBO_EXPORT core::Result<core::Array<Entry>> entriesOfMonth(Month month);

		// empty when the month has no entries
		KAKEIBO_EXPORT core::Result<std::optional<MonthlySummary>> monthlySummary(Month month);
		// one per month with entries, ascending
		KAKEIBO_EXPORT core::Result<core::Array<MonthlySummary>> monthlySummaries();
		KAKEIBO_EXPORT core::Result<std::optional<MonthlyStatistics>> monthlyStatistics(Month month);

		// months of the active and archived entries, newest first
		KAKEIBO_EXPORT core::Result<core::Array<Month>> availableMonths();
		// months of the active entries only, newest first
		KAKEIBO_EXPORT core::Result<core::Array<Month>> activeMonths();

		// moves the month's entries into the archive table, returns the moved count
		KAKEIBO_EXPORT core::Result<int64_t> archiveMonth(Month month, Date archivedDate);
		// moves the month's archived entries back with new ids, returns the restored count
		KAKEIBO_EXPORT core::Result<int64_t> restoreMonth(Month month);
	};
}
