#pragma once

namespace ari::cli
{

	/** Entry point of the ari-kernel tool; returns the process exit code. */
	int run(int argc, char *argv[]);

} // namespace ari::cli
