#include <cpptrace/cpptrace.hpp>
#include <memory>
#include <stdexcept>

#include "command_line_parser.hpp"
#include "daemon.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "helixd");

    // First pass only to learn --config; the second lets the environment and
    // then the command line override whatever the settings file holds.
    try {
      settings->apply_environment();
      parser.parse(argc, argv, *settings);
      if(settings->help_requested()) {
        parser.usage();
        return 0;
      }
      settings->load();
      settings->apply_environment();
      parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        print_err(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    Daemon daemon(settings, Daemon::Options{});
    daemon.start();
    daemon.run();
    return 0;
  } catch(std::exception& e) {
    init_logging();
    Logger logger("helixd-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
