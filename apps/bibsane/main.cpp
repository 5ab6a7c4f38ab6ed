#include "bibsane/core/version.h"

#include "commands/cache_list.h"
#include "commands/sanitize.h"
#include <curl/curl.h>

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc > 1) {
    const std::string first = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (first == "--version") {
      std::cout << "bibsane v" << bibsane::core::kBuildVersion << "\n";
      return 0;
    }
    if (first == "cache-list") {
      return cmd_cache_list(argc, argv);
    }
  }

  // libcurl must be initialized once per process before any easy handle exists.
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error: curl_global_init() failed\n";
    return 1;
  }

  int start = 1;
  if (argc > 1 && std::string(argv[1]) == "sanitize") {  // NOLINT
    start = 2;
  }
  const int exit_code = cmd_sanitize(argc, argv, start);

  curl_global_cleanup();
  return exit_code;
}
