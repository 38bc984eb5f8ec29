#include "kakeibo-gui/MainWindow.h"

#include <core/Mallocator.h>
#include <core/Log.h>

#include <kakeibo/Args.h>
#include <kakeibo/Config.h>
#include <kakeibo/Ledger.h>
#include <kakeibo/Reminder.h>

#include <QApplication>
#include <QMessageBox>

int main(int argc, char* argv[])
{
	core::Mallocator allocator{};
	core::Log log{&allocator};

	auto argsResult = kakeibo::Args::parse(argc, argv, {"init-db"_sv}, &allocator);
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

	if (auto logResult = core::Log::openFile(config.logPath, &allocator); logResult.isError())
		log.warn("logging to the console only, {}"_sv, logResult.error());
	else
		log = logResult.releaseValue();
	core::setAssertLog(&log);

	auto ledgerResult = kakeibo::Ledger::open(config.dbPath, &log, &allocator);
	if (ledgerResult.isError())
	{
		log.critical("failed to open ledger file, {}"_sv, ledgerResult.releaseError());
		return EXIT_FAILURE;
	}
	auto ledger = ledgerResult.releaseValue();

	if (args.hasSwitch("init-db"_sv))
	{
		log.info("データベースを初期化しました: {}"_sv, config.dbPath);
		return EXIT_SUCCESS;
	}

	QApplication app(argc, argv);

	MainWindow window{ledger, config, &allocator};
	window.show();

	auto windowPtr = &window;
	kakeibo::Reminder reminder{
		config.reminderAt,
		[windowPtr] {
			QMetaObject::invokeMethod(windowPtr, [windowPtr] { windowPtr->showReminder(); }, Qt::QueuedConnection);
		},
		&allocator
	};
	if (config.reminderEnabled)
	{
		reminder.start();
		log.info("リマインダースレッド開始: 毎日{}"_sv, kakeibo::formatTimeOfDay(config.reminderAt, &allocator));
	}

	auto res = app.exec();
	reminder.stop();
	log.info("家計簿アプリを終了します (終了コード: {})"_sv, res);
	return res;
}
