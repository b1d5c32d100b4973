#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include "client.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

int report(const Response& r){
  if(r.ok){
    print_out(nullptr, "{}", r.payload.dump(2));
    return 0;
  }
  const auto err = r.error.value_or(ErrorInfo{});
  print_err(nullptr, "error [{}]: {}", to_string(err.code), err.message);
  return 2;
}

} // namespace

int main(int argc, char** argv){
  SettingsManager settings(CTL_SETTINGS_SPECIFICATION);
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "helixctl",
                           "talk to a running helixd",
                           CTL_SETTINGS_SPECIFICATION,
                           nlohmann::json::array({
                             {{"index",0},{"key","command"}},
                             {{"index",1},{"key","argument"}}
                           }));
  try {
    settings.apply_environment();
    parser.parse(argc, argv, settings);
  } catch(const std::invalid_argument& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return 1;
  }

  const auto command = settings.get<std::string>("command");
  const auto argument = settings.get<std::string>("argument");
  if(settings.help_requested() || command.empty()){
    parser.usage();
    return settings.help_requested() ? 0 : 1;
  }

  auto repo_root = settings.get<std::string>("repo_root");
  if(repo_root.empty()) repo_root = std::filesystem::current_path().string();
  const int timeout_ms = settings.get<int>("timeout_ms");

  DaemonClient client(settings.get<std::string>("socket_path"),
                      settings.get<std::string>("tool"),
                      repo_root);
  try {
    if(command == "ping") return report(client.ping());
    if(command == "status") return report(client.status());
    if(command == "shutdown") return report(client.shutdown(argument));
    if(command == "enqueue" || command == "sync"){
      auto queued = client.enqueue_sync(argument.empty() ? "." : argument, settings.get<bool>("force"));
      if(command == "enqueue" || !queued.ok) return report(queued);
      // sync = enqueue and wait on the same connection
      return report(client.wait_sync(queued.payload.value("sync_id", ""), static_cast<uint64_t>(timeout_ms)));
    }
    if(command == "wait"){
      if(argument.empty()){
        print_err(nullptr, "wait needs a sync id");
        return 1;
      }
      return report(client.wait_sync(argument, static_cast<uint64_t>(timeout_ms)));
    }
  } catch(const std::system_error& e) {
    print_err(nullptr, "cannot talk to helixd at {}: {}", client.socket_path(), e.what());
    return 3;
  } catch(const std::exception& e) {
    print_err(nullptr, "bad reply from helixd: {}", e.what());
    return 3;
  }

  print_err(nullptr, "unknown command '{}'", command);
  parser.usage();
  return 1;
}
