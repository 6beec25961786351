#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " (--connect=<host:port> | --listen=<port>) [options]\n"
      << "\n"
      << "Mode:\n"
      << "  --connect=<host:port>  Connect to a TCP server ([v6]:port for IPv6 literals)\n"
      << "  --listen=<port>        Accept TCP connections (0 = pick a free port)\n"
      << "  --bind=<ip>            Server bind address (default: 127.0.0.1)\n"
      << "  --timeout=<seconds>    Client connect timeout, 1..3600 (default: 8)\n"
      << "\n"
      << "Driver:\n"
      << "  --threads=<n>          I/O threads (default: 0 = hardware concurrency)\n"
      << "  --tick=<ms>            Polling interval, 10..1000 (default: 50)\n"
      << "  --json                 Print log entries as JSON lines\n"
      << "\n"
      << "Console commands (stdin):\n"
      << "  <hex bytes>            Send bytes, e.g. DE AD BE EF (server: to every active client)\n"
      << "  :text <string>         Send the bytes of a string\n"
      << "  :to <ip:port> <hex>    Send to one server-side connection\n"
      << "  :kick <ip:port>        Shut down one server-side connection\n"
      << "  :list                  List server-side connections\n"
      << "  :prune                 Drop inactive server-side connections\n"
      << "  :state                 Show the current state\n"
      << "  :quit                  Shut down and exit (also EOF, Ctrl+C)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, app, all\n"
      << "                       Can be comma-separated: --debug=network,app\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "  --logfile=<path>     Write the application log to a rotating file\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    palm::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;
    bool have_mode = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << palm::GetFullVersionString() << std::endl;
        std::cout << palm::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--connect=") == 0) {
        std::string address = arg.substr(10);
        std::string host;
        uint16_t port = 0;
        if (!palm::util::SplitHostPort(address, host, port)) {
          std::cerr << "Error: Invalid address: " << address << std::endl;
          std::cerr << "Expected host:port or [ipv6]:port" << std::endl;
          return 1;
        }
        if (have_mode) {
          std::cerr << "Error: --connect and --listen are mutually exclusive" << std::endl;
          return 1;
        }
        have_mode = true;
        config.mode = palm::app::Mode::CLIENT;
        config.connect_address = address;
      } else if (arg.find("--listen=") == 0) {
        // Port 0 is allowed here (ephemeral), so no SafeParsePort
        auto port_opt = palm::util::SafeParseInt(arg.substr(9), 0, 65535);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(9) << std::endl;
          std::cerr << "Port must be a number between 0 and 65535" << std::endl;
          return 1;
        }
        if (have_mode) {
          std::cerr << "Error: --connect and --listen are mutually exclusive" << std::endl;
          return 1;
        }
        have_mode = true;
        config.mode = palm::app::Mode::SERVER;
        config.listen_port = static_cast<uint16_t>(*port_opt);
      } else if (arg.find("--bind=") == 0) {
        auto ip = palm::util::ValidateAndNormalizeIP(arg.substr(7));
        if (!ip) {
          std::cerr << "Error: Invalid bind address: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.bind_address = *ip;
      } else if (arg.find("--timeout=") == 0) {
        auto seconds_opt = palm::util::SafeParseInt(arg.substr(10), 1, 3600);
        if (!seconds_opt) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.connect_timeout = std::chrono::seconds(*seconds_opt);
      } else if (arg.find("--threads=") == 0) {
        auto threads_opt = palm::util::SafeParseInt(arg.substr(10), 0, 256);
        if (!threads_opt) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(10) << std::endl;
          std::cerr << "Threads must be a number between 0 and 256" << std::endl;
          return 1;
        }
        config.io_threads = static_cast<size_t>(*threads_opt);
      } else if (arg.find("--tick=") == 0) {
        auto tick_opt = palm::util::SafeParseInt(arg.substr(7), 10, 1000);
        if (!tick_opt) {
          std::cerr << "Error: Invalid tick interval: " << arg.substr(7) << std::endl;
          std::cerr << "Tick must be a number of milliseconds between 10 and 1000" << std::endl;
          return 1;
        }
        config.tick = std::chrono::milliseconds(*tick_opt);
      } else if (arg == "--json") {
        config.json_output = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
        if (log_file.empty()) {
          std::cerr << "Error: --logfile needs a path" << std::endl;
          return 1;
        }
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,app
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (!have_mode) {
      std::cerr << "Error: one of --connect or --listen is required" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    // Initialize logging system (console on stderr unless --logfile is given)
    palm::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    // Apply component-specific debug levels
    for (const auto& component : debug_components) {
      if (component == "all") {
        palm::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        palm::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        palm::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int status = 0;

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents race conditions where async callbacks try to log after logger is destroyed
    {
      palm::app::Application app(config, std::cout);

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until :quit, EOF, a signal, or the end of the client session
      status = app.run();

      // app destructor runs here, stopping all network operations
    }

    // Shutdown logging AFTER app is fully destroyed
    palm::util::LogManager::Shutdown();

    return status;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    palm::util::LogManager::Shutdown();
    return 1;
  }
}
