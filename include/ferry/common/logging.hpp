#pragma once

#include <string>

namespace ferry::common {

/// Installs an async default logger writing to stdout and `log_file`.
void init_logging(const std::string& name,
                  const std::string& log_file,
                  bool verbose);

}  // namespace ferry::common
