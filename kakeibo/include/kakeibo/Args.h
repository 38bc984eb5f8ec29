#pragma once

#include "kakeibo/Exports.h"

#include <core/Array.h>
#include <core/Result.h>
#include <core/StringView.h>

#include <initializer_list>

namespace kakeibo
{
	struct Option
	{
		core::StringView name;
		core::StringView& value;
		bool required = true;
	};

	// command line arguments, "-name value", "--name value" and "--name=value" are options,
	// names listed as switches take no value, everything else is a positional argument.
	// the views point into argv which must outlive the args
	class Args
	{
		struct NamedValue
		{
			core::StringView name;
			core::StringView value;
		};

		core::Allocator* m_allocator = nullptr;
		core::Array<core::StringView> m_positionals;
		core::Array<NamedValue> m_options;
		core::Array<core::StringView> m_switches;

		explicit Args(core::Allocator* allocator)
			: m_allocator(allocator),
			  m_positionals(allocator),
			  m_options(allocator),
			  m_switches(allocator)
		{}

		const NamedValue* lookup(core::StringView name) const;

	public:
		// argv[0] is skipped
		KAKEIBO_EXPORT static core::Result<Args> parse(
			int argc,
			char** argv,
			std::initializer_list<core::StringView> switches,
			core::Allocator* allocator
		);

		const core::Array<core::StringView>& positionals() const { return m_positionals; }
		core::StringView positional(size_t index) const
		{
			if (index < m_positionals.count())
				return m_positionals[index];
			return {};
		}

		bool hasOption(core::StringView name) const { return lookup(name) != nullptr; }
		// empty if the option doesn't exist
		KAKEIBO_EXPORT core::StringView option(core::StringView name) const;
		KAKEIBO_EXPORT bool hasSwitch(core::StringView name) const;

		KAKEIBO_EXPORT core::HumanError loadOptions(std::initializer_list<Option> options) const;
		// fails on the first option whose name is not in the given list
		KAKEIBO_EXPORT core::HumanError rejectUnknownOptions(std::initializer_list<core::StringView> known) const;
	};
}
