#pragma once

#include "core/Exports.h"
#include "core/Result.h"
#include "core/StringView.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace core
{
	class Log
	{
		Allocator* m_allocator = nullptr;
		std::shared_ptr<spdlog::logger> m_logger;

	public:
		using level = spdlog::level::level_enum;

		// colored console logger
		CORE_EXPORT explicit Log(Allocator* allocator);

		Log(std::shared_ptr<spdlog::logger> logger, Allocator* allocator)
			: m_allocator(allocator),
			  m_logger(std::move(logger))
		{}

		// console logger which also appends to the given file
		CORE_EXPORT static Result<Log> openFile(StringView path, Allocator* allocator);

		Allocator* allocator() const
		{
			return m_allocator;
		}

		void setLevel(level value)
		{
			m_logger->set_level(value);
		}

		void setPattern(StringView pattern)
		{
			m_logger->set_pattern(std::string{pattern.data(), pattern.count()});
		}

		void setFlushLevel(level value)
		{
			m_logger->flush_on(value);
		}

		void flush()
		{
			m_logger->flush();
		}

		template <typename... TArgs>
		void trace(StringView format, TArgs&&... args)
		{
			m_logger->trace(
				fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template <typename... TArgs>
		void debug(StringView format, TArgs&&... args)
		{
			m_logger->debug(
				fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template <typename... TArgs>
		void info(StringView format, TArgs&&... args)
		{
			m_logger->info(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template <typename... TArgs>
		void error(StringView format, TArgs&&... args)
		{
			m_logger->error(
				fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template <typename... TArgs>
		void warn(StringView format, TArgs&&... args)
		{
			m_logger->warn(fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}

		template <typename... TArgs>
		void critical(StringView format, TArgs&&... args)
		{
			m_logger->critical(
				fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<TArgs>(args)...);
		}
	};
}
