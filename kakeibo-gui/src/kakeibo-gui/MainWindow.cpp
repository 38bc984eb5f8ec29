#include "kakeibo-gui/MainWindow.h"

#include <kakeibo/Backup.h>
#include <kakeibo/Exchange.h>
#include <kakeibo/Reminder.h>

#include <QComboBox>
#include <QDialog>
#include <QDialogButtonBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QTabWidget>
#include <QTableWidget>
#include <QVBoxLayout>

namespace
{
	enum TABLE_COLUMN
	{
		TABLE_COLUMN_ID,
		TABLE_COLUMN_DATE,
		TABLE_COLUMN_CATEGORY,
		TABLE_COLUMN_SUBJECT,
		TABLE_COLUMN_AMOUNT,
		TABLE_COLUMN_COUNT,
	};

	const QString CSV_FILTER = QStringLiteral("CSVファイル (*.csv);;すべてのファイル (*.*)");

	QString qstr(core::StringView str)
	{
		return QString::fromUtf8(str.data(), qsizetype(str.count()));
	}

	// keeps the utf-8 bytes alive while the view is used
	class Utf8
	{
		QByteArray m_bytes;
	public:
		explicit Utf8(const QString& str)
			: m_bytes(str.toUtf8())
		{}

		core::StringView view() const { return core::StringView{m_bytes.constData(), size_t(m_bytes.size())}; }
		operator core::StringView() const { return view(); }
	};

	kakeibo::COLUMN ledgerColumn(int column)
	{
		switch (column)
		{
		case TABLE_COLUMN_DATE: return kakeibo::COLUMN_DATE;
		case TABLE_COLUMN_CATEGORY: return kakeibo::COLUMN_CATEGORY;
		case TABLE_COLUMN_SUBJECT: return kakeibo::COLUMN_SUBJECT;
		case TABLE_COLUMN_AMOUNT: return kakeibo::COLUMN_AMOUNT;
		default:
			core::unreachable();
			return kakeibo::COLUMN_DATE;
		}
	}
}

MainWindow::MainWindow(kakeibo::Ledger& ledger, const kakeibo::Config& config, core::Allocator* allocator, QWidget* parent)
	: QMainWindow(parent),
	  m_ledger(ledger),
	  m_config(config),
	  m_allocator(allocator)
{
	setWindowTitle(QStringLiteral("家計簿日報システム"));
	resize(800, 600);

	auto tabs = new QTabWidget{this};
	tabs->addTab(createInputTab(), QStringLiteral("入力"));
	tabs->addTab(createTableTab(), QStringLiteral("表示・編集"));
	tabs->addTab(createSummaryTab(), QStringLiteral("月次集計"));
	tabs->addTab(createMonthTab(), QStringLiteral("月別管理"));
	setCentralWidget(tabs);

	reloadTable();
	reloadMonths();
}

QWidget* MainWindow::createInputTab()
{
	auto tab = new QWidget{};
	auto form = new QFormLayout{tab};

	m_dateEdit = new QLineEdit{qstr(kakeibo::formatDate(kakeibo::today(), m_allocator))};
	m_dateEdit->setPlaceholderText(QStringLiteral("2024-01-15, 2024/1/15, 令和6年1月15日, R6/1/15"));
	form->addRow(QStringLiteral("日付:"), m_dateEdit);

	m_categoryCombo = new QComboBox{};
	m_categoryCombo->addItem(qstr(kakeibo::categoryName(kakeibo::CATEGORY_EXPENSE)));
	m_categoryCombo->addItem(qstr(kakeibo::categoryName(kakeibo::CATEGORY_INCOME)));
	form->addRow(QStringLiteral("区分:"), m_categoryCombo);

	m_subjectEdit = new QLineEdit{};
	form->addRow(QStringLiteral("科目:"), m_subjectEdit);

	m_amountEdit = new QLineEdit{};
	form->addRow(QStringLiteral("金額:"), m_amountEdit);

	auto saveButton = new QPushButton{QStringLiteral("保存")};
	connect(saveButton, &QPushButton::clicked, this, &MainWindow::onSave);
	form->addRow(saveButton);
	return tab;
}

QWidget* MainWindow::createTableTab()
{
	auto tab = new QWidget{};
	auto layout = new QVBoxLayout{tab};

	m_table = new QTableWidget{0, TABLE_COLUMN_COUNT};
	m_table->setHorizontalHeaderLabels({
		QStringLiteral("ID"),
		QStringLiteral("日付"),
		QStringLiteral("区分"),
		QStringLiteral("科目"),
		QStringLiteral("金額"),
	});
	m_table->horizontalHeader()->setStretchLastSection(true);
	m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
	m_table->setSelectionMode(QAbstractItemView::SingleSelection);
	connect(m_table, &QTableWidget::itemChanged, this, &MainWindow::onCellChanged);
	layout->addWidget(m_table);

	auto buttons = new QHBoxLayout{};
	auto addButton = [&](const QString& text, void (MainWindow::*slot)()) {
		auto button = new QPushButton{text};
		connect(button, &QPushButton::clicked, this, slot);
		buttons->addWidget(button);
	};
	addButton(QStringLiteral("更新"), &MainWindow::reloadTable);
	addButton(QStringLiteral("削除"), &MainWindow::onDelete);
	addButton(QStringLiteral("CSVエクスポート"), &MainWindow::onExport);
	addButton(QStringLiteral("CSVインポート"), &MainWindow::onImport);
	addButton(QStringLiteral("バックアップ"), &MainWindow::onBackup);
	layout->addLayout(buttons);
	return tab;
}

QWidget* MainWindow::createSummaryTab()
{
	auto tab = new QWidget{};
	auto layout = new QVBoxLayout{tab};

	auto row = new QHBoxLayout{};
	row->addWidget(new QLabel{QStringLiteral("月 (YYYY-MM):")});
	m_summaryMonthEdit = new QLineEdit{qstr(kakeibo::formatMonth(kakeibo::monthOf(kakeibo::today()), m_allocator))};
	row->addWidget(m_summaryMonthEdit);
	auto summaryButton = new QPushButton{QStringLiteral("集計")};
	connect(summaryButton, &QPushButton::clicked, this, &MainWindow::onSummary);
	row->addWidget(summaryButton);
	layout->addLayout(row);

	m_summaryText = new QPlainTextEdit{};
	m_summaryText->setReadOnly(true);
	layout->addWidget(m_summaryText);
	return tab;
}

QWidget* MainWindow::createMonthTab()
{
	auto tab = new QWidget{};
	auto layout = new QHBoxLayout{tab};

	auto left = new QVBoxLayout{};
	left->addWidget(new QLabel{QStringLiteral("対象月:")});
	m_monthList = new QListWidget{};
	connect(m_monthList, &QListWidget::currentRowChanged, this, [this](int) { onMonthSelected(); });
	left->addWidget(m_monthList);
	layout->addLayout(left, 1);

	auto right = new QVBoxLayout{};
	m_statsText = new QPlainTextEdit{};
	m_statsText->setReadOnly(true);
	right->addWidget(m_statsText);

	auto buttons = new QHBoxLayout{};
	auto addButton = [&](const QString& text, void (MainWindow::*slot)()) {
		auto button = new QPushButton{text};
		connect(button, &QPushButton::clicked, this, slot);
		buttons->addWidget(button);
	};
	addButton(QStringLiteral("月別バックアップ"), &MainWindow::onMonthBackup);
	addButton(QStringLiteral("月別アーカイブ"), &MainWindow::onMonthArchive);
	addButton(QStringLiteral("月別復元"), &MainWindow::onMonthRestore);
	right->addLayout(buttons);

	auto exports = new QHBoxLayout{};
	auto monthExport = new QPushButton{QStringLiteral("月別集計CSV出力")};
	connect(monthExport, &QPushButton::clicked, this, &MainWindow::onMonthExport);
	exports->addWidget(monthExport);
	auto compareExport = new QPushButton{QStringLiteral("複数月比較CSV出力")};
	connect(compareExport, &QPushButton::clicked, this, &MainWindow::onCompareExport);
	exports->addWidget(compareExport);
	right->addLayout(exports);

	auto cleanup = new QHBoxLayout{};
	cleanup->addWidget(new QLabel{QStringLiteral("保持月数:")});
	m_keepSpin = new QSpinBox{};
	m_keepSpin->setRange(kakeibo::Config::MIN_MONTHS_TO_KEEP, kakeibo::Config::MAX_MONTHS_TO_KEEP);
	m_keepSpin->setValue(m_config.monthsToKeep);
	cleanup->addWidget(m_keepSpin);
	auto cleanupButton = new QPushButton{QStringLiteral("自動クリーンアップ")};
	connect(cleanupButton, &QPushButton::clicked, this, &MainWindow::onCleanup);
	cleanup->addWidget(cleanupButton);
	right->addLayout(cleanup);

	layout->addLayout(right, 2);
	return tab;
}

void MainWindow::showError(const QString& title, const core::HumanError& err)
{
	m_ledger.log()->error("{}: {}"_sv, Utf8{title}.view(), err);
	QMessageBox::warning(this, title, qstr(err.message()));
}

bool MainWindow::confirm(const QString& title, const QString& text)
{
	auto reply = QMessageBox::question(this, title, text, QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
	return reply == QMessageBox::Yes;
}

bool MainWindow::selectedMonth(kakeibo::Month& month)
{
	auto item = m_monthList->currentItem();
	if (item == nullptr)
	{
		QMessageBox::warning(this, QStringLiteral("警告"), QStringLiteral("月を選択してください"));
		return false;
	}

	auto monthResult = kakeibo::parseMonth(Utf8{item->text()}, m_allocator);
	if (monthResult.isError())
	{
		showError(QStringLiteral("エラー"), monthResult.error());
		return false;
	}
	month = monthResult.value();
	return true;
}

void MainWindow::reloadTable()
{
	auto entriesResult = m_ledger.entries();
	if (entriesResult.isError())
	{
		showError(QStringLiteral("エラー"), entriesResult.error());
		return;
	}
	const auto& entries = entriesResult.value();

	m_loading = true;
	m_table->setRowCount(0);
	m_table->setRowCount(int(entries.count()));
	for (size_t i = 0; i < entries.count(); ++i)
	{
		const auto& entry = entries[i];
		auto row = int(i);

		auto idItem = new QTableWidgetItem{QString::number(qlonglong(entry.id))};
		idItem->setData(Qt::UserRole, qlonglong(entry.id));
		idItem->setFlags(idItem->flags() & ~Qt::ItemIsEditable);
		m_table->setItem(row, TABLE_COLUMN_ID, idItem);
		m_table->setItem(row, TABLE_COLUMN_DATE, new QTableWidgetItem{qstr(kakeibo::formatDate(entry.date, m_allocator))});
		m_table->setItem(row, TABLE_COLUMN_CATEGORY, new QTableWidgetItem{qstr(kakeibo::categoryName(entry.category))});
		m_table->setItem(row, TABLE_COLUMN_SUBJECT, new QTableWidgetItem{qstr(entry.subject)});
		m_table->setItem(row, TABLE_COLUMN_AMOUNT, new QTableWidgetItem{qstr(core::strf(m_allocator, "{}"_sv, entry.amount))});
	}
	m_loading = false;
}

void MainWindow::reloadMonths()
{
	auto monthsResult = m_ledger.availableMonths();
	if (monthsResult.isError())
	{
		showError(QStringLiteral("エラー"), monthsResult.error());
		return;
	}

	m_monthList->clear();
	for (auto month: monthsResult.value())
		m_monthList->addItem(qstr(kakeibo::formatMonth(month, m_allocator)));
	m_statsText->clear();
}

void MainWindow::showReminder()
{
	m_ledger.log()->info("リマインダー実行: {}"_sv, kakeibo::REMINDER_MESSAGE);
	QMessageBox::information(this, QStringLiteral("リマインダー"), QString::fromUtf8(kakeibo::REMINDER_MESSAGE));
}

void MainWindow::onSave()
{
	Utf8 date{m_dateEdit->text()};
	Utf8 category{m_categoryCombo->currentText()};
	Utf8 subject{m_subjectEdit->text()};
	Utf8 amount{m_amountEdit->text()};

	auto entryResult = kakeibo::parseEntry(date, category, subject, amount, m_allocator);
	if (entryResult.isError())
	{
		showError(QStringLiteral("入力エラー"), entryResult.error());
		return;
	}

	auto idResult = m_ledger.addEntry(entryResult.value());
	if (idResult.isError())
	{
		showError(QStringLiteral("エラー"), idResult.error());
		return;
	}

	QMessageBox::information(this, QStringLiteral("成功"), QStringLiteral("データを保存しました"));
	m_subjectEdit->clear();
	m_amountEdit->clear();
	reloadTable();
	reloadMonths();
}

void MainWindow::onCellChanged(QTableWidgetItem* item)
{
	if (m_loading || item->column() == TABLE_COLUMN_ID)
		return;

	auto idItem = m_table->item(item->row(), TABLE_COLUMN_ID);
	if (idItem == nullptr)
		return;

	auto id = int64_t(idItem->data(Qt::UserRole).toLongLong());
	if (auto err = m_ledger.updateField(id, ledgerColumn(item->column()), Utf8{item->text()}))
		showError(QStringLiteral("編集エラー"), err);
	else
		reloadMonths();

	// the table is rebuilt outside of the signal, it reverts rejected edits and normalizes accepted ones
	QMetaObject::invokeMethod(this, &MainWindow::reloadTable, Qt::QueuedConnection);
}

void MainWindow::onDelete()
{
	auto row = m_table->currentRow();
	auto idItem = row >= 0 ? m_table->item(row, TABLE_COLUMN_ID) : nullptr;
	if (idItem == nullptr)
	{
		QMessageBox::warning(this, QStringLiteral("警告"), QStringLiteral("削除する行を選択してください"));
		return;
	}

	auto id = int64_t(idItem->data(Qt::UserRole).toLongLong());
	if (confirm(QStringLiteral("確認"), QStringLiteral("ID=%1 のデータを削除しますか？").arg(qlonglong(id))) == false)
		return;

	if (auto err = m_ledger.deleteEntry(id))
	{
		showError(QStringLiteral("エラー"), err);
		return;
	}

	reloadTable();
	reloadMonths();
}

void MainWindow::onExport()
{
	auto path = QFileDialog::getSaveFileName(this, QStringLiteral("CSVファイル保存"), QDir::homePath(), CSV_FILTER);
	if (path.isEmpty())
		return;

	auto countResult = kakeibo::exportEntries(m_ledger, Utf8{path});
	if (countResult.isError())
	{
		showError(QStringLiteral("エクスポートエラー"), countResult.error());
		return;
	}

	QMessageBox::information(
		this,
		QStringLiteral("CSVエクスポート"),
		QStringLiteral("CSVファイルにエクスポートしました (%1件)\n%2").arg(qulonglong(countResult.value())).arg(path)
	);
}

void MainWindow::onImport()
{
	auto path = QFileDialog::getOpenFileName(this, QStringLiteral("CSVファイル選択"), QDir::homePath(), CSV_FILTER);
	if (path.isEmpty())
		return;

	auto reportResult = kakeibo::importEntries(m_ledger, Utf8{path});
	if (reportResult.isError())
	{
		showError(QStringLiteral("インポートエラー"), reportResult.error());
		return;
	}

	const auto& report = reportResult.value();
	auto text = qstr(kakeibo::importReportText(report, m_allocator));
	if (report.errorCount > 0)
		QMessageBox::warning(this, QStringLiteral("インポート結果"), text);
	else
		QMessageBox::information(this, QStringLiteral("インポート結果"), text);

	reloadTable();
	reloadMonths();
}

void MainWindow::onBackup()
{
	auto pathResult = kakeibo::backupDatabase(m_ledger, m_config.backupDir, kakeibo::now());
	if (pathResult.isError())
	{
		showError(QStringLiteral("バックアップエラー"), pathResult.error());
		return;
	}

	QMessageBox::information(
		this,
		QStringLiteral("バックアップ"),
		QStringLiteral("バックアップが成功しました。\nファイル名: %1").arg(qstr(pathResult.value()))
	);
}

void MainWindow::onSummary()
{
	auto monthResult = kakeibo::parseMonth(Utf8{m_summaryMonthEdit->text()}, m_allocator);
	if (monthResult.isError())
	{
		QMessageBox::warning(this, QStringLiteral("入力エラー"), QStringLiteral("月はYYYY-MM形式で入力してください。"));
		return;
	}

	auto summaryResult = m_ledger.monthlySummary(monthResult.value());
	if (summaryResult.isError())
	{
		showError(QStringLiteral("エラー"), summaryResult.error());
		return;
	}

	const auto& summary = summaryResult.value();
	if (summary.has_value())
		m_summaryText->setPlainText(qstr(kakeibo::summaryText(*summary, m_allocator)));
	else
		m_summaryText->setPlainText(QStringLiteral("データがありません"));
}

void MainWindow::onMonthSelected()
{
	auto item = m_monthList->currentItem();
	if (item == nullptr)
	{
		m_statsText->clear();
		return;
	}

	auto monthResult = kakeibo::parseMonth(Utf8{item->text()}, m_allocator);
	if (monthResult.isError())
		return;

	auto statsResult = m_ledger.monthlyStatistics(monthResult.value());
	if (statsResult.isError())
	{
		showError(QStringLiteral("エラー"), statsResult.error());
		return;
	}

	const auto& stats = statsResult.value();
	if (stats.has_value())
		m_statsText->setPlainText(qstr(kakeibo::statisticsText(*stats, m_allocator)));
	else
		m_statsText->setPlainText(QStringLiteral("%1の有効なデータがありません (アーカイブ済み)").arg(item->text()));
}

void MainWindow::onMonthBackup()
{
	kakeibo::Month month;
	if (selectedMonth(month) == false)
		return;

	auto pathResult = kakeibo::backupMonth(m_ledger, month, m_config.backupDir, kakeibo::now());
	if (pathResult.isError())
	{
		showError(QStringLiteral("月別バックアップ"), pathResult.error());
		return;
	}

	QMessageBox::information(
		this,
		QStringLiteral("月別バックアップ"),
		QStringLiteral("%1のデータをバックアップしました\n%2")
			.arg(qstr(kakeibo::formatMonth(month, m_allocator)))
			.arg(qstr(pathResult.value()))
	);
}

void MainWindow::onMonthArchive()
{
	kakeibo::Month month;
	if (selectedMonth(month) == false)
		return;

	auto monthText = qstr(kakeibo::formatMonth(month, m_allocator));
	if (confirm(QStringLiteral("確認"), QStringLiteral("%1のデータをアーカイブしますか？").arg(monthText)) == false)
		return;

	auto countResult = m_ledger.archiveMonth(month, kakeibo::today());
	if (countResult.isError())
	{
		showError(QStringLiteral("アーカイブエラー"), countResult.error());
		return;
	}

	QMessageBox::information(
		this,
		QStringLiteral("アーカイブ"),
		QStringLiteral("%1のデータをアーカイブしました\n件数: %2").arg(monthText).arg(qlonglong(countResult.value()))
	);
	reloadTable();
	reloadMonths();
}

void MainWindow::onMonthRestore()
{
	kakeibo::Month month;
	if (selectedMonth(month) == false)
		return;

	auto monthText = qstr(kakeibo::formatMonth(month, m_allocator));
	if (confirm(QStringLiteral("確認"), QStringLiteral("%1のデータを復元しますか？").arg(monthText)) == false)
		return;

	auto countResult = m_ledger.restoreMonth(month);
	if (countResult.isError())
	{
		showError(QStringLiteral("復元エラー"), countResult.error());
		return;
	}

	QMessageBox::information(
		this,
		QStringLiteral("復元"),
		QStringLiteral("%1のデータを復元しました\n件数: %2").arg(monthText).arg(qlonglong(countResult.value()))
	);
	reloadTable();
	reloadMonths();
}

void MainWindow::onMonthExport()
{
	kakeibo::Month month;
	if (selectedMonth(month) == false)
		return;

	auto defaultName = QStringLiteral("月別集計_%1%2.csv")
		.arg(int(month.year()), 4, 10, QLatin1Char('0'))
		.arg(unsigned(month.month()), 2, 10, QLatin1Char('0'));
	auto path = QFileDialog::getSaveFileName(
		this,
		QStringLiteral("月別集計CSV保存"),
		QDir::home().filePath(defaultName),
		CSV_FILTER
	);
	if (path.isEmpty())
		return;

	auto filesResult = kakeibo::exportMonthlyStatistics(m_ledger, month, Utf8{path});
	if (filesResult.isError())
	{
		showError(QStringLiteral("CSV出力エラー"), filesResult.error());
		return;
	}

	const auto& files = filesResult.value();
	QMessageBox::information(
		this,
		QStringLiteral("CSV出力成功"),
		QStringLiteral("月別集計CSV出力完了:\n%1\n%2\n%3")
			.arg(qstr(files.summaryPath))
			.arg(qstr(files.subjectsPath))
			.arg(qstr(files.detailPath))
	);
}

void MainWindow::onCompareExport()
{
	if (m_monthList->count() == 0)
	{
		QMessageBox::warning(this, QStringLiteral("エラー"), QStringLiteral("比較可能な月のデータがありません"));
		return;
	}

	QDialog dialog{this};
	dialog.setWindowTitle(QStringLiteral("複数月選択"));
	dialog.resize(300, 400);

	auto layout = new QVBoxLayout{&dialog};
	layout->addWidget(new QLabel{QStringLiteral("比較したい月を複数選択してください")});
	auto list = new QListWidget{};
	list->setSelectionMode(QAbstractItemView::MultiSelection);
	for (int i = 0; i < m_monthList->count(); ++i)
		list->addItem(m_monthList->item(i)->text());
	layout->addWidget(list);

	auto buttons = new QDialogButtonBox{QDialogButtonBox::Ok | QDialogButtonBox::Cancel};
	connect(buttons, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
	connect(buttons, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);
	layout->addWidget(buttons);

	if (dialog.exec() != QDialog::Accepted)
		return;

	core::Array<kakeibo::Month> months{m_allocator};
	QStringList names;
	// list order, newest first
	for (int i = 0; i < list->count(); ++i)
	{
		auto item = list->item(i);
		if (item->isSelected() == false)
			continue;

		auto monthResult = kakeibo::parseMonth(Utf8{item->text()}, m_allocator);
		if (monthResult.isError())
			continue;
		months.push(monthResult.value());
		names.push_back(item->text().remove(QLatin1Char('-')));
	}

	if (months.count() == 0)
	{
		QMessageBox::warning(this, QStringLiteral("エラー"), QStringLiteral("月を選択してください"));
		return;
	}

	auto range = names.size() > 1 ? QStringLiteral("%1_%2").arg(names.back(), names.front()) : names.front();
	auto path = QFileDialog::getSaveFileName(
		this,
		QStringLiteral("複数月比較CSV保存"),
		QDir::home().filePath(QStringLiteral("複数月比較_%1.csv").arg(range)),
		CSV_FILTER
	);
	if (path.isEmpty())
		return;

	auto countResult = kakeibo::exportMonthComparison(m_ledger, months, Utf8{path});
	if (countResult.isError())
	{
		showError(QStringLiteral("CSV出力エラー"), countResult.error());
		return;
	}

	QMessageBox::information(this, QStringLiteral("CSV出力成功"), QStringLiteral("複数月比較CSV出力完了:\n%1").arg(path));
}

void MainWindow::onCleanup()
{
	auto monthsToKeep = m_keepSpin->value();
	if (confirm(
		QStringLiteral("確認"),
		QStringLiteral("古いデータを自動クリーンアップしますか？\n保持月数: %1ヶ月").arg(monthsToKeep)) == false)
	{
		return;
	}

	auto reportResult = kakeibo::cleanupOldData(m_ledger, monthsToKeep, m_config.backupDir, kakeibo::now());
	if (reportResult.isError())
	{
		showError(QStringLiteral("クリーンアップエラー"), reportResult.error());
		return;
	}

	const auto& report = reportResult.value();
	auto text = qstr(kakeibo::cleanupReportText(report, m_allocator));
	if (report.failedMonths.count() > 0)
		QMessageBox::warning(this, QStringLiteral("完了"), text);
	else
		QMessageBox::information(this, QStringLiteral("完了"), text);

	reloadTable();
	reloadMonths();
}
