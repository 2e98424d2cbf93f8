#include "ApiClient.hpp"
#include "CommandLine.hpp"
#include "Downloader.hpp"
#include "Errors.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "UrlBuilder.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "danfetch";

  danfetch::ParsedCommandLine parsed;
  try {
    parsed = danfetch::parseCommandLine(argc, argv);
  } catch (const danfetch::UsageError &e) {
    std::cerr << program << ": " << e.what() << "\n\n"
              << danfetch::usageText(program);
    return 2;
  }
  if (parsed.help) {
    std::cout << danfetch::usageText(program);
    return 0;
  }

  const danfetch::Options &options = parsed.options;
  danfetch::Logger log(options.verbosity);
  log.debug("ARGV", std::vector<std::string>(argv + 1, argv + argc));

  try {
    // Output directory becomes the working directory for the whole run
    if (!fs::exists(options.outputDir)) {
      log.progress("Main", "Creating output directory: " + options.outputDir);
      fs::create_directories(options.outputDir);
    }
    fs::current_path(options.outputDir);

    danfetch::UrlBuilder urls(danfetch::UrlBuilder::credentialFromEnvironment());
    danfetch::HttplibClient http;
    danfetch::ApiClient api(http, urls, log);
    danfetch::Downloader downloader(api, log);

    auto summary = downloader.run(options.command);
    log.progress("Main", std::to_string(summary.succeeded) + " of " +
                             std::to_string(summary.attempted) +
                             " posts downloaded, " +
                             std::to_string(summary.failed) + " failed");
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
