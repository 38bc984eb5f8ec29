#include "kakeibo/Args.h"

#include <cstdint>

namespace kakeibo
{
	namespace
	{
		bool contains(std::initializer_list<core::StringView> names, core::StringView name)
		{
			for (auto n: names)
				if (n == name)
					return true;
			return false;
		}
	}

	const Args::NamedValue* Args::lookup(core::StringView name) const
	{
		for (const auto& option: m_options)
			if (option.name == name)
				return &option;
		return nullptr;
	}

	core::Result<Args> Args::parse(
		int argc,
		char** argv,
		std::initializer_list<core::StringView> switches,
		core::Allocator* allocator
	)
	{
		Args res{allocator};
		for (int i = 1; i < argc; ++i)
		{
			auto arg = core::StringView{argv[i]};
			if (arg.count() < 2 || arg.startsWith("-"_sv) == false)
			{
				res.m_positionals.push(arg);
				continue;
			}

			auto name = arg.startsWith("--"_sv) ? arg.sliceRight(2) : arg.sliceRight(1);
			if (name.count() == 0)
				return core::errf(allocator, "invalid option '{}'"_sv, arg);

			if (contains(switches, name))
			{
				if (res.hasSwitch(name) == false)
					res.m_switches.push(name);
				continue;
			}

			core::StringView value;
			auto eq = name.find('=');
			if (eq != SIZE_MAX)
			{
				value = name.sliceRight(eq + 1);
				name = name.slice(0, eq);
			}
			else if (i + 1 < argc)
			{
				value = core::StringView{argv[++i]};
			}
			else
			{
				return core::errf(allocator, "option '{}' has no value"_sv, name);
			}

			if (res.hasOption(name))
				return core::errf(allocator, "option '{}' is already defined"_sv, name);
			res.m_options.push(NamedValue{name, value.trim()});
		}
		return res;
	}

	core::StringView Args::option(core::StringView name) const
	{
		if (auto option = lookup(name))
			return option->value;
		return {};
	}

	bool Args::hasSwitch(core::StringView name) const
	{
		for (auto s: m_switches)
			if (s == name)
				return true;
		return false;
	}

	core::HumanError Args::loadOptions(std::initializer_list<Option> options) const
	{
		for (auto& option: options)
		{
			if (auto found = lookup(option.name))
			{
				option.value = found->value;
			}
			else if (option.required)
			{
				return core::errf(m_allocator, "required option '{}' doesn't exist"_sv, option.name);
			}
		}
		return {};
	}

	core::HumanError Args::rejectUnknownOptions(std::initializer_list<core::StringView> known) const
	{
		for (const auto& option: m_options)
		{
			if (contains(known, option.name) == false)
				return core::errf(m_allocator, "unknown option '{}'"_sv, option.name);
		}
		return {};
	}
}
