#pragma once

#include "core/Allocator.h"

#include <new>
#include <type_traits>
#include <utility>

namespace core
{
	template<typename T>
	class Unique
	{
		template<typename U>
		friend class Unique;

		Allocator* m_allocator = nullptr;
		T* m_ptr = nullptr;

		void destroy()
		{
			if (m_ptr)
			{
				m_ptr->~T();
				m_allocator->release(Span<std::byte>{(std::byte*)m_ptr, sizeof(T)});
				m_allocator->free(Span<std::byte>{(std::byte*)m_ptr, sizeof(T)});
				m_ptr = nullptr;
			}
		}

	public:
		Unique() = default;

		Unique(Allocator* a, T* p)
			: m_allocator(a),
			  m_ptr(p)
		{}

		Unique(std::nullptr_t) {}

		Unique(const Unique&) = delete;

		Unique(Unique&& other) noexcept
			: m_allocator(other.m_allocator),
			  m_ptr(other.leak())
		{}

		template<typename U>
		requires std::is_convertible_v<U*, T*>
		Unique(Unique<U>&& other)
			: m_allocator(other.m_allocator),
			  m_ptr(other.leak())
		{}

		Unique& operator=(const Unique&) = delete;

		Unique& operator=(Unique&& other) noexcept
		{
			destroy();
			m_allocator = other.m_allocator;
			m_ptr = other.leak();
			return *this;
		}

		~Unique()
		{
			destroy();
		}

		T& operator*() const { return *m_ptr; }
		T* operator->() const { return m_ptr; }

		explicit operator bool() const { return m_ptr != nullptr; }

		T* get() const { return m_ptr; }

		[[nodiscard]] T* leak()
		{
			auto p = m_ptr;
			m_ptr = nullptr;
			return p;
		}

		Allocator* allocator() const { return m_allocator; }
	};

	template<typename T, typename... TArgs>
	inline Unique<T> unique_from(Allocator* allocator, TArgs&&... args)
	{
		auto bytes = allocator->alloc(sizeof(T), alignof(T));
		allocator->commit(bytes);
		::new (bytes.data()) T(std::forward<TArgs>(args)...);
		return Unique<T>{allocator, (T*)bytes.data()};
	}
}
