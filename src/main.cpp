#include "archive/archiver.hpp"
#include "cache/cache_service.hpp"
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/tcp_remote_store.hpp"
#include <iostream>
#include <string>
#include <vector>

int run_command(const rcache::cli::ProgramOptions& options) {
  try {
    rcache::config::Config config = rcache::config::Config::from_environment();
    rcache::cli::apply_overrides(options, config);

    const rcache::logger::severity_level level = options.log_level.value_or(
      config.verbose ? rcache::logger::severity_level::debug : rcache::logger::severity_level::info);
    rcache::logger::init_logging(config.log_file, level, config.verbose);

    if (!config.is_enabled()) {
      std::cerr << "Error: Remote cache is not configured, set " << rcache::config::ENV_REMOTE_CACHE_URL
                << " and " << rcache::config::ENV_API_KEY << " or pass --endpoint and --api-key\n";
      return 1;
    }
    config.validate();

    rcache::network::TcpRemoteStore remote(config.endpoint(), config.credential);
    rcache::archive::TarArchiver archiver;
    rcache::KeyVersioning versioning(config.salt);
    rcache::CacheService service(remote, archiver, versioning);

    rcache::cli::CLI cli(service, std::cout);
    return cli.run(options, config.max_frame_bytes);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  if (const auto options = rcache::cli::parse_command_line(args, std::cerr); !options.valid) {
    rcache::cli::print_usage(argv[0], std::cerr);
    return 1;
  } else {
    return run_command(options);
  }
}
