#pragma once

#include <core/Array.h>
#include <core/File.h>
#include <core/Log.h>
#include <core/Path.h>
#include <core/String.h>

#include <spdlog/sinks/null_sink.h>

#include <doctest/doctest.h>

#include <chrono>
#include <memory>

// logger which drops everything
inline core::Log nullLog(core::Allocator* allocator)
{
	auto logger = std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
	return core::Log{std::move(logger), allocator};
}

// fresh directory under the system temp dir, removes the registered files and itself on exit
class TempDir
{
	core::Allocator* m_allocator = nullptr;
	core::String m_path;
	core::Array<core::String> m_files;

public:
	explicit TempDir(core::Allocator* allocator)
		: m_allocator(allocator),
		  m_path(allocator),
		  m_files(allocator)
	{
		static int counter = 0;

		auto tmpResult = core::Path::tmpDir(allocator);
		REQUIRE(tmpResult.isError() == false);

		auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		auto name = core::strf(allocator, "kakeibo-test-{}-{}"_sv, stamp, counter++);
		m_path = core::Path::join(allocator, tmpResult.value(), name);
		REQUIRE(!core::File::createDirectories(m_path, allocator));
	}

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	~TempDir()
	{
		for (size_t i = m_files.count(); i > 0; --i)
		{
			if (core::File::exists(m_files[i - 1], m_allocator))
				CHECK(!core::File::remove(m_files[i - 1], m_allocator));
		}
		CHECK(!core::File::remove(m_path, m_allocator));
	}

	core::StringView path() const { return m_path; }

	// path of a file inside the directory, removed on exit
	core::String file(core::StringView name)
	{
		auto res = core::Path::join(m_allocator, m_path, name);
		track(res);
		return res;
	}

	void track(core::StringView path)
	{
		m_files.push(core::String{path, m_allocator});
	}
};
