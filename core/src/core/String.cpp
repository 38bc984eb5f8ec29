#include "core/String.h"

namespace core
{
	void String::destroy()
	{
		if (m_allocator == nullptr || m_ptr == nullptr)
			return;

		m_allocator->release(Span<std::byte>{(std::byte*)m_ptr, m_capacity});
		m_allocator->free(Span<std::byte>{(std::byte*)m_ptr, m_capacity});
		m_ptr = nullptr;
		m_capacity = 0;
		m_count = 0;
	}

	void String::copyFrom(const String& other)
	{
		m_allocator = other.m_allocator;
		m_count = other.m_count;
		m_capacity = 0;
		m_ptr = nullptr;

		if (other.m_ptr == nullptr)
			return;

		m_capacity = m_count + 1;
		m_ptr = (char*)m_allocator->alloc(m_capacity, alignof(char)).data();
		m_allocator->commit(Span<std::byte>{(std::byte*)m_ptr, m_capacity});

		::memcpy(m_ptr, other.m_ptr, m_count);
		m_ptr[m_count] = '\0';
	}

	void String::moveFrom(String&& other)
	{
		m_allocator = other.m_allocator;
		m_ptr = other.m_ptr;
		m_count = other.m_count;
		m_capacity = other.m_capacity;

		other.m_ptr = nullptr;
		other.m_count = 0;
		other.m_capacity = 0;
	}

	void String::grow(size_t new_capacity)
	{
		validate(m_allocator != nullptr);

		auto new_ptr = (char*)m_allocator->alloc(new_capacity, alignof(char)).data();
		m_allocator->commit(Span<std::byte>{(std::byte*)new_ptr, new_capacity});

		if (m_ptr)
		{
			::memcpy(new_ptr, m_ptr, m_count + 1);
			m_allocator->release(Span<std::byte>{(std::byte*)m_ptr, m_capacity});
			m_allocator->free(Span<std::byte>{(std::byte*)m_ptr, m_capacity});
		}
		else
		{
			new_ptr[0] = '\0';
		}

		m_ptr = new_ptr;
		m_capacity = new_capacity;
	}

	void String::ensureSpaceExists(size_t count)
	{
		// +1 for the null terminator
		if (m_count + count + 1 > m_capacity)
		{
			auto new_capacity = m_capacity * 2;
			if (new_capacity < 16)
				new_capacity = 16;

			if (new_capacity < m_count + count + 1)
				new_capacity = m_count + count + 1;

			grow(new_capacity);
		}
	}

	void String::resize(size_t new_count)
	{
		if (new_count > m_count)
			ensureSpaceExists(new_count - m_count);
		else if (m_ptr == nullptr)
			ensureSpaceExists(0);

		if (new_count > m_count)
			::memset(m_ptr + m_count, 0, new_count - m_count);

		m_count = new_count;
		m_ptr[m_count] = '\0';
	}

	String::String(StringView str, Allocator* allocator)
		: m_allocator(allocator)
	{
		if (str.count() != 0)
		{
			m_count = str.count();
			m_capacity = m_count + 1;

			m_ptr = (char*)m_allocator->alloc(m_capacity, alignof(char)).data();
			m_allocator->commit(Span<std::byte>{(std::byte*)m_ptr, m_capacity});

			::memcpy(m_ptr, str.begin(), m_count);
			m_ptr[m_count] = '\0';
		}
	}

	void String::push(StringView str)
	{
		if (str.count() == 0)
			return;

		ensureSpaceExists(str.count());
		::memcpy(m_ptr + m_count, str.begin(), str.count());
		m_count += str.count();
		m_ptr[m_count] = '\0';
	}

	void String::pushByte(char v)
	{
		ensureSpaceExists(1);
		m_ptr[m_count] = v;
		++m_count;
		m_ptr[m_count] = '\0';
	}

	void String::replace(StringView search, StringView replace)
	{
		if (search.count() == 0)
			return;

		String out{m_allocator};
		out.reserve(m_count);
		StringView self = *this;
		size_t it = 0;
		while (it < m_count)
		{
			auto search_it = self.find(search, it);
			if (search_it == SIZE_MAX)
			{
				out.push(self.slice(it, m_count));
				break;
			}

			out.push(self.slice(it, search_it));
			out.push(replace);
			it = search_it + search.count();
		}
		*this = std::move(out);
	}
}
