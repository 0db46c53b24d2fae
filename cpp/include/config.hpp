#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace ptyshell {
namespace core {
struct Config {
	std::string shellPath{"/bin/bash"};      ///< Shell used to run scripts as `shellPath -c <script>`
	std::string workingDirectory{""};        ///< Working directory for scripts (empty = current directory)
	int  timeoutSeconds{1800};               ///< Default per-execution timeout (seconds)
	size_t cacheCapacity{1000};              ///< Max cached output events per identifier
	size_t readBufferSize{4096};             ///< Bytes requested per PTY read
	int  killGraceMs{1000};                  ///< Wait after SIGTERM before escalating to SIGKILL
	unsigned short terminalRows{24};         ///< Initial PTY window size
	unsigned short terminalCols{80};
	std::map<std::string, std::string> environment;   ///< Extra environment variables
};
} // namespace core
} // namespace ptyshell
