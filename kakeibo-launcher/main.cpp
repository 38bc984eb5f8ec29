#include <core/Mallocator.h>
#include <core/Log.h>
#include <core/Path.h>

#include <kakeibo/Launcher.h>

int main(int argc, char** argv)
{
	core::Mallocator allocator{};
	core::Log log{&allocator};

	auto exeDirResult = core::Path::executableDir(&allocator);
	if (exeDirResult.isError())
	{
		log.error("failed to find the executable directory, {}"_sv, exeDirResult.releaseError());
		exeDirResult = core::String{&allocator};
	}

	auto workingDirResult = core::Path::workingDir(&allocator);
	if (workingDirResult.isError())
	{
		log.error("failed to find the working directory, {}"_sv, workingDirResult.releaseError());
		workingDirResult = core::String{&allocator};
	}

	auto candidates = kakeibo::launcherCandidates(
		exeDirResult.value(),
		workingDirResult.value(),
		[&allocator](core::StringView name) { return core::Path::env(name, &allocator); },
		&allocator
	);

	core::Array<core::String> args{&allocator};
	for (int i = 1; i < argc; ++i)
		args.push(core::String{core::StringView{argv[i]}, &allocator});

	auto hooks = kakeibo::systemLauncherHooks(&allocator);
	return kakeibo::launch(candidates, args, hooks, &allocator);
}
