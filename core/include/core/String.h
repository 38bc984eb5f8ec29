#pragma once

#include "core/Exports.h"
#include "core/Allocator.h"
#include "core/StringView.h"
#include "core/Assert.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstring>
#include <iterator>
#include <utility>

namespace core
{
	class String
	{
		Allocator* m_allocator = nullptr;
		char* m_ptr = nullptr;
		size_t m_capacity = 0;
		size_t m_count = 0;

		CORE_EXPORT void destroy();

		CORE_EXPORT void copyFrom(const String& other);

		CORE_EXPORT void moveFrom(String&& other);

		void grow(size_t new_capacity);

		CORE_EXPORT void ensureSpaceExists(size_t count);

	public:
		explicit String(Allocator* allocator)
			: m_allocator(allocator)
		{}

		CORE_EXPORT String(StringView str, Allocator* allocator);

		String(const String& other)
		{
			copyFrom(other);
		}

		String(String&& other) noexcept
		{
			moveFrom(std::move(other));
		}

		String& operator=(const String& other)
		{
			if (this == &other)
				return *this;
			destroy();
			copyFrom(other);
			return *this;
		}

		String& operator=(String&& other) noexcept
		{
			destroy();
			moveFrom(std::move(other));
			return *this;
		}

		String& operator=(StringView other)
		{
			*this = String(other, m_allocator);
			return *this;
		}

		~String()
		{
			destroy();
		}

		char& operator[](size_t i)
		{
			validate(i < m_count);
			return m_ptr[i];
		}

		const char& operator[](size_t i) const
		{
			validate(i < m_count);
			return m_ptr[i];
		}

		operator StringView() const { return StringView{m_ptr, m_count}; }

		size_t count() const { return m_count; }
		bool empty() const { return m_count == 0; }
		size_t capacity() const { return m_capacity; }
		char* data() { return m_ptr; }
		const char* data() const { return m_ptr; }
		// never null, points to an empty string when nothing is allocated
		const char* c_str() const { return m_ptr ? m_ptr : ""; }
		Allocator* allocator() const { return m_allocator; }

		CORE_EXPORT void resize(size_t new_count);
		void reserve(size_t extra_count) { ensureSpaceExists(extra_count); }

		CORE_EXPORT void push(StringView str);
		CORE_EXPORT void pushByte(char v);

		size_t find(StringView str, size_t start = 0) const { return StringView{*this}.find(str, start); }
		size_t find(char c, size_t start = 0) const { return StringView{*this}.find(c, start); }

		bool operator==(const String& other) const { return StringView{*this} == StringView{other}; }
		bool operator!=(const String& other) const { return StringView{*this} != StringView{other}; }
		bool operator<(const String& other) const { return StringView{*this} < StringView{other}; }
		bool operator==(StringView other) const { return StringView{*this} == other; }
		bool operator!=(StringView other) const { return StringView{*this} != other; }

		CORE_EXPORT void replace(StringView search, StringView replace);

		const char* begin() const { return m_ptr; }
		char* begin() { return m_ptr; }
		const char* end() const { return m_ptr + m_count; }
		char* end() { return m_ptr + m_count; }

		bool startsWith(StringView other) const { return StringView{*this}.startsWith(other); }
		bool endsWith(StringView other) const { return StringView{*this}.endsWith(other); }
	};

	class StringBackInserter
	{
		String* m_str = nullptr;
	public:
		using iterator_category = std::output_iterator_tag;
		using value_type = void;
		using difference_type = ptrdiff_t;
		using pointer = void;
		using reference = void;

		StringBackInserter(String* str)
			: m_str(str)
		{}

		StringBackInserter& operator=(char v)
		{
			m_str->pushByte(v);
			return *this;
		}

		StringBackInserter& operator*() { return *this; }
		StringBackInserter& operator++() { return *this; }
		StringBackInserter& operator++(int) { return *this; }
	};

	template<typename ... Args>
	[[nodiscard]] inline String strf(Allocator* allocator, StringView format, Args&& ... args)
	{
		String out{allocator};
		StringBackInserter it{&out};
		fmt::format_to(it, fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<Args>(args)...);
		return out;
	}
}

namespace fmt
{
	template<>
	struct formatter<core::String>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const core::String& str, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
