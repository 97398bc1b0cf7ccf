#include "cuesheet.h"

#include <catch2/catch_all.hpp>

#include <iostream>

int main(int argc, char *argv[]) {
  struct csh_LibraryConfig cfg;
  csh_libraryConfigSetDefaults(&cfg);
  cfg.log_level = CSH_LOG_LEVEL_WARN;
  cfg.logging_backend = CSH_LOGGING_BACKEND_STDERR;

  if (csh_initializeWithConfig(&cfg) != 0) {
    std::cerr << "Unable to initialize cuesheet: " << csh_getLastErrorMessage() << std::endl;
    return 1;
  }

  int result = Catch::Session().run(argc, argv);
  csh_shutdown();
  return result;
}
