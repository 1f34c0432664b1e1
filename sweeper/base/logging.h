#ifndef SWEEPER_BASE_LOGGING_H_
#define SWEEPER_BASE_LOGGING_H_

#include <string>

namespace sweeper {
namespace base {

// Installs a color logger writing to stderr as the default spdlog logger.
//
// Standard output is left to the user interface. The level defaults to warn
// and can be changed through the environment, e.g. SPDLOG_LEVEL=debug.
//
// Must be called at most once per process.
void InitLogging(const std::string& name);

}  // namespace base
}  // namespace sweeper

#endif  // SWEEPER_BASE_LOGGING_H_
