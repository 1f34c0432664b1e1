#include "sweeper/base/logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sweeper {
namespace base {

void InitLogging(const std::string& name) {
  spdlog::set_default_logger(spdlog::stderr_color_mt(name));
  spdlog::set_level(spdlog::level::warn);
  spdlog::cfg::load_env_levels();
}

}  // namespace base
}  // namespace sweeper
