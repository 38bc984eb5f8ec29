#pragma once

#include <kakeibo/Config.h>
#include <kakeibo/Ledger.h>

#include <QMainWindow>

class QComboBox;
class QLineEdit;
class QListWidget;
class QPlainTextEdit;
class QSpinBox;
class QTableWidget;
class QTableWidgetItem;

class MainWindow: public QMainWindow
{
	Q_OBJECT

	kakeibo::Ledger& m_ledger;
	const kakeibo::Config& m_config;
	core::Allocator* m_allocator = nullptr;
	// set while the table is being filled so cell edits are not written back
	bool m_loading = false;

	QLineEdit* m_dateEdit = nullptr;
	QComboBox* m_categoryCombo = nullptr;
	QLineEdit* m_subjectEdit = nullptr;
	QLineEdit* m_amountEdit = nullptr;

	QTableWidget* m_table = nullptr;

	QLineEdit* m_summaryMonthEdit = nullptr;
	QPlainTextEdit* m_summaryText = nullptr;

	QListWidget* m_monthList = nullptr;
	QPlainTextEdit* m_statsText = nullptr;
	QSpinBox* m_keepSpin = nullptr;

	QWidget* createInputTab();
	QWidget* createTableTab();
	QWidget* createSummaryTab();
	QWidget* createMonthTab();

	// logs the error and shows it in a message box
	void showError(const QString& title, const core::HumanError& err);
	bool confirm(const QString& title, const QString& text);
	bool selectedMonth(kakeibo::Month& month);

	void onSave();
	void onCellChanged(QTableWidgetItem* item);
	void onDelete();
	void onExport();
	void onImport();
	void onBackup();
	void onSummary();
	void onMonthSelected();
	void onMonthBackup();
	void onMonthArchive();
	void onMonthRestore();
	void onMonthExport();
	void onCompareExport();
	void onCleanup();

public:
	MainWindow(kakeibo::Ledger& ledger, const kakeibo::Config& config, core::Allocator* allocator, QWidget* parent = nullptr);

	void reloadTable();
	void reloadMonths();
	void showReminder();
};
