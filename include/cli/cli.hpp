#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "cache/cache_service.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"

namespace rcache {
namespace cli {

enum class Command {
  NONE,
  SAVE,
  RESTORE
};

struct ProgramOptions {
  Command command{Command::NONE};
  std::vector<std::string> paths;
  std::string key;
  std::vector<std::string> restore_keys;
  bool cross_os{false};
  bool lookup_only{false};
  std::optional<std::size_t> chunk_size;
  std::optional<std::string> endpoint;
  std::optional<std::string> api_key;
  std::optional<std::string> log_file;
  // Takes precedence over the level implied by verbose
  std::optional<logger::severity_level> log_level;
  bool verbose{false};
  bool valid{false};
};

// ---- ARGUMENT PARSING ----
// args excludes the program name. Problems are reported on err and leave valid unset.
ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err);
void print_usage(const std::string& program_name, std::ostream& out);
// Command-line values win over the environment
void apply_overrides(const ProgramOptions& options, config::Config& config);


class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(CacheService& service, std::ostream& out);


  // ---- EXECUTION ----
  // Returns the process exit code
  int run(const ProgramOptions& options, std::optional<std::size_t> default_chunk_size = std::nullopt);

private:
  // ---- PARAMETERS ----
  CacheService& service_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  int handle_save_command(const ProgramOptions& options, std::optional<std::size_t> chunk_size);
  int handle_restore_command(const ProgramOptions& options);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace rcache
