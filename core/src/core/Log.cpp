#include "core/Log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace core
{
	Log::Log(Allocator* allocator)
		: m_allocator(allocator)
	{
		auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		m_logger = std::make_shared<spdlog::logger>("console", sink);
		setPattern("[%H:%M:%S.%e %z] [thread %t] [%^%l%$] [%n] %v"_sv);
		setFlushLevel(level::err);

#if defined(DEBUG)
		setLevel(level::trace);
#endif
	}

	Result<Log> Log::openFile(StringView path, Allocator* allocator)
	{
		auto cPath = String{path, allocator};
		std::shared_ptr<spdlog::sinks::basic_file_sink_mt> fileSink;
		try
		{
			fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{cPath.c_str()}, false);
		}
		catch (const spdlog::spdlog_ex& ex)
		{
			return errf(allocator, "failed to open log file '{}', {}"_sv, path, ex.what());
		}

		auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		auto logger = std::make_shared<spdlog::logger>("kakeibo", spdlog::sinks_init_list{consoleSink, fileSink});

		Log res{std::move(logger), allocator};
		res.setPattern("%Y-%m-%d %H:%M:%S - %l - %v"_sv);
		res.setFlushLevel(level::warn);
		return res;
	}
}
