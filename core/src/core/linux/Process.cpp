#include "core/Process.h"

#include <spawn.h>
#include <sys/wait.h>
#include <errno.h>
#include <string.h>

extern char** environ;

namespace core
{
	Result<int> Process::run(StringView program, const Array<String>& args, Allocator* allocator)
	{
		auto cProgram = String{program, allocator};

		Array<char*> argv{allocator};
		argv.push(const_cast<char*>(cProgram.c_str()));
		for (const auto& arg: args)
			argv.push(const_cast<char*>(arg.c_str()));
		argv.push(nullptr);

		pid_t pid = 0;
		// posix_spawnp searches PATH only when the program has no slash in it
		auto res = posix_spawnp(&pid, cProgram.c_str(), nullptr, nullptr, argv.data(), environ);
		if (res != 0)
			return errf(allocator, "failed to start '{}', {}"_sv, program, strerror(res));

		int status = 0;
		while (waitpid(pid, &status, 0) == -1)
		{
			if (errno != EINTR)
				return errf(allocator, "failed to wait for '{}', {}"_sv, program, strerror(errno));
		}

		if (WIFEXITED(status))
			return WEXITSTATUS(status);
		if (WIFSIGNALED(status))
			return 128 + WTERMSIG(status);
		return -1;
	}
}
