#include "cli/cli.hpp"
#include "cache/errors.hpp"
#include <iostream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace rcache {
namespace cli {

namespace {

enum class Flag {
  PATH,
  KEY,
  RESTORE_KEY,
  CROSS_OS,
  LOOKUP_ONLY,
  CHUNK_SIZE,
  ENDPOINT,
  API_KEY,
  LOG_FILE,
  LOG_LEVEL,
  VERBOSE
};

struct FlagSpec {
  Flag flag;
  bool takes_value;
};

const std::unordered_map<std::string, FlagSpec>& flag_table() {
  static const std::unordered_map<std::string, FlagSpec> table = {
    {"-p", {Flag::PATH, true}},
    {"--path", {Flag::PATH, true}},
    {"-k", {Flag::KEY, true}},
    {"--key", {Flag::KEY, true}},
    {"-r", {Flag::RESTORE_KEY, true}},
    {"--restore-key", {Flag::RESTORE_KEY, true}},
    {"--cross-os", {Flag::CROSS_OS, false}},
    {"--lookup-only", {Flag::LOOKUP_ONLY, false}},
    {"--chunk-size", {Flag::CHUNK_SIZE, true}},
    {"--endpoint", {Flag::ENDPOINT, true}},
    {"--api-key", {Flag::API_KEY, true}},
    {"--log-file", {Flag::LOG_FILE, true}},
    {"--log-level", {Flag::LOG_LEVEL, true}},
    {"-v", {Flag::VERBOSE, false}},
    {"--verbose", {Flag::VERBOSE, false}}
  };
  return table;
}

bool parse_size(const std::string& text, std::size_t& value) {
  if (text.empty() || text.size() > 12 || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  value = static_cast<std::size_t>(std::stoull(text));
  return true;
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " save -p <path> [-p <path>...] -k <key> [options]\n"
      << "       " << program_name << " restore -p <path> [-p <path>...] -k <key> [-r <key>...] [options]\n"
      << "Options:\n"
      << "  -p, --path         Path to cache (repeatable)\n"
      << "  -k, --key          Primary cache key\n"
      << "  -r, --restore-key  Fallback key for restore, tried in order (repeatable)\n"
      << "  --cross-os         Allow the cache to be shared across platforms\n"
      << "  --lookup-only      Restore: check for a hit without downloading\n"
      << "  --chunk-size       Save: upload frame size in bytes\n"
      << "  --endpoint         Remote cache URL (overrides " << config::ENV_REMOTE_CACHE_URL << ")\n"
      << "  --api-key          Credential (overrides " << config::ENV_API_KEY << ")\n"
      << "  --log-file         Log file path\n"
      << "  --log-level        trace, debug, info, warning, error or fatal\n"
      << "  -v, --verbose      Debug logging, mirrored to stderr\n"
      << "Example: " << program_name << " save -p build/ -k linux-deps-42\n";
}

ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err) {
  ProgramOptions options;

  if (args.empty()) {
    err << "Error: Missing command\n";
    return options;
  }

  if (args[0] == "save") {
    options.command = Command::SAVE;
  } else if (args[0] == "restore") {
    options.command = Command::RESTORE;
  } else {
    err << "Error: Unknown command: " << args[0] << '\n';
    return options;
  }

  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];
    const auto it = flag_table().find(arg);
    if (it == flag_table().end()) {
      err << "Error: Unknown argument: " << arg << '\n';
      return options;
    }

    std::string value;
    if (it->second.takes_value) {
      if (i + 1 >= args.size()) {
        err << "Error: Missing value for " << arg << '\n';
        return options;
      }
      value = args[++i];
    }

    switch (it->second.flag) {
      case Flag::PATH:
        options.paths.push_back(value);
        break;
      case Flag::KEY:
        options.key = value;
        break;
      case Flag::RESTORE_KEY:
        options.restore_keys.push_back(value);
        break;
      case Flag::CROSS_OS:
        options.cross_os = true;
        break;
      case Flag::LOOKUP_ONLY:
        options.lookup_only = true;
        break;
      case Flag::CHUNK_SIZE: {
        std::size_t size = 0;
        if (!parse_size(value, size)) {
          err << "Error: Invalid chunk size: " << value << '\n';
          return options;
        }
        options.chunk_size = size;
        break;
      }
      case Flag::ENDPOINT:
        options.endpoint = value;
        break;
      case Flag::API_KEY:
        options.api_key = value;
        break;
      case Flag::LOG_FILE:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        options.log_level = logger::parse_severity(value);
        if (!options.log_level) {
          err << "Error: Invalid log level: " << value << '\n';
          return options;
        }
        break;
      case Flag::VERBOSE:
        options.verbose = true;
        break;
    }
  }

  if (options.key.empty()) {
    err << "Error: A key is required\n";
    return options;
  }
  if (options.command == Command::SAVE && !options.restore_keys.empty()) {
    err << "Error: --restore-key only applies to restore\n";
    return options;
  }
  if (options.command == Command::SAVE && options.lookup_only) {
    err << "Error: --lookup-only only applies to restore\n";
    return options;
  }

  options.valid = true;
  return options;
}

void apply_overrides(const ProgramOptions& options, config::Config& config) {
  if (options.endpoint) {
    config.remote_cache_url = *options.endpoint;
  }
  if (options.api_key) {
    config.credential = *options.api_key;
  }
  if (options.log_file) {
    config.log_file = *options.log_file;
  }
  if (options.chunk_size) {
    config.max_frame_bytes = options.chunk_size;
  }
  if (options.verbose) {
    config.verbose = true;
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(CacheService& service, std::ostream& out)
  : service_(service)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized";
}

//==============================================
// EXECUTION
//==============================================

int CLI::run(const ProgramOptions& options, std::optional<std::size_t> default_chunk_size) {
  try {
    switch (options.command) {
      case Command::SAVE:
        return handle_save_command(options, options.chunk_size ? options.chunk_size : default_chunk_size);
      case Command::RESTORE:
        return handle_restore_command(options);
      case Command::NONE:
        break;
    }
  }
  catch (const ValidationError& e) {
    log_and_display_error("Invalid input", e.what());
    return 1;
  }

  out_ << "Unknown command or invalid arguments" << std::endl;
  return 1;
}

//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::handle_save_command(const ProgramOptions& options, std::optional<std::size_t> chunk_size) {
  const int cache_id = service_.save(options.paths, options.key, options.cross_os, chunk_size);
  const bool saved = cache_id == CacheService::SAVE_SUCCEEDED;
  out_ << "cache-saved: " << (saved ? "true" : "false") << std::endl;
  return 0;
}

int CLI::handle_restore_command(const ProgramOptions& options) {
  const auto matched_key = service_.restore(
    options.paths, options.key, options.restore_keys, options.cross_os, options.lookup_only);

  // Exact hit only when the primary key matched
  const bool exact = matched_key && *matched_key == options.key;
  out_ << "cache-hit: " << (exact ? "true" : "false") << std::endl;
  if (matched_key) {
    out_ << "matched-key: " << *matched_key << std::endl;
  }
  return 0;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace rcache
