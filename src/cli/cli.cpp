#include "cli/cli.hpp"
#include "code/code_generator.hpp"
#include "code/document_types.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace docreg {
namespace cli {

namespace {

constexpr const char* PROMPT = "DocReg> ";
constexpr const char* DEFAULT_PREFIX = "OT";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(registry::RegistrationService& registration,
         const registry::LookupEngine& lookup,
         const registry::IntegrityVerifier& verifier,
         std::istream& input,
         std::ostream& output)
  : running_(false)
  , registration_(registration)
  , lookup_(lookup)
  , verifier_(verifier)
  , input_(input)
  , output_(output) {
  LOG_INFO << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  LOG_INFO << "CLI: Starting CLI loop";
  output_ << PROMPT << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << PROMPT << std::flush;
    }
  }

  LOG_INFO << "CLI: CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  iss >> command;

  if (command.empty()) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  LOG_DEBUG << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help") {
      handle_help_command();
    }
    else if (command == "types") {
      handle_types_command();
    }
    else if (command == "generate") {
      handle_generate_command(args);
    }
    else if (command == "register") {
      handle_register_command(args);
    }
    else if (command == "resolve") {
      handle_resolve_command(args);
    }
    else if (command == "verify") {
      handle_verify_command(args);
    }
    else if (command == "search") {
      handle_search_command(args);
    }
    else {
      output_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error running '" + command + "'", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                                      Display this help message" << std::endl;
  output_ << "  types                                     List document type prefixes" << std::endl;
  output_ << "  generate <PP>                             Generate a new hash code" << std::endl;
  output_ << "  register <user> <file> [PP|code] [--overwrite]" << std::endl;
  output_ << "                                            Hash <file> and register it" << std::endl;
  output_ << "  resolve <code>                            Look up a full or short code" << std::endl;
  output_ << "  verify <code> <file>                      Check <file> against the registered hash" << std::endl;
  output_ << "  search <fragment>                         Find codes containing <fragment>" << std::endl;
  output_ << "  quit                                      Exit the shell" << std::endl << std::endl;
}

void CLI::handle_types_command() {
  for (const auto& type : code::document_types()) {
    output_ << "  " << type.prefix << "  " << type.display << " (" << type.code << ")" << std::endl;
  }
}

void CLI::handle_generate_command(const std::vector<std::string>& args) {
  const std::string prefix = args.empty() ? DEFAULT_PREFIX : args[0];
  if (!code::is_valid_prefix(prefix)) {
    output_ << "Invalid prefix: " << prefix << ". Usage: generate <PP>" << std::endl;
    return;
  }

  const std::string hash_code = code::generate_code(prefix);
  output_ << "Hash code:  " << hash_code << std::endl;
  output_ << "Short code: " << code::derive_short_code(hash_code) << std::endl;
}

void CLI::handle_register_command(const std::vector<std::string>& args) {
  if (args.size() < 2) {
    output_ << "Usage: register <user> <file> [PP|code] [--overwrite]" << std::endl;
    return;
  }

  registry::RegistrationRequest request;
  request.owner_namespace = args[0];
  request.type_prefix = DEFAULT_PREFIX;

  for (size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--overwrite") {
      request.overwrite = true;
    } else if (args[i].size() == code::PREFIX_LENGTH) {
      request.type_prefix = args[i];
    } else {
      request.hash_code = args[i];
    }
  }

  const std::filesystem::path file_path(args[1]);
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << file_path.string() << std::endl;
    return;
  }
  std::stringstream content;
  content << file.rdbuf();
  request.file_name = file_path.filename().string();

  const registry::RegistrationResult result = registration_.register_content(request, content.str());
  output_ << result.message << std::endl;
  if (result.success) {
    output_ << "  Hash code:  " << *result.hash_code << std::endl;
    output_ << "  Short code: " << *result.short_code << std::endl;
    output_ << "  Path:       " << *result.path << std::endl;
  }
}

void CLI::handle_resolve_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: resolve <code>" << std::endl;
    return;
  }

  const registry::LookupResult result = lookup_.resolve(args[0]);
  output_ << result.message << std::endl;
  if (result.found()) {
    print_record(*result.record);
  }
}

void CLI::handle_verify_command(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    output_ << "Usage: verify <code> <file>" << std::endl;
    return;
  }

  std::ifstream file(args[1], std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << args[1] << std::endl;
    return;
  }

  const registry::IntegrityResult result = verifier_.verify_integrity(args[0], file);
  output_ << (result.valid ? "VALID: " : "INVALID: ") << result.message << std::endl;
  output_ << "  Hash code:       " << result.hash_code << std::endl;
  if (result.calculated_hash) {
    output_ << "  Calculated hash: " << *result.calculated_hash << std::endl;
  }
  if (result.stored_hash) {
    output_ << "  Stored hash:     " << *result.stored_hash << std::endl;
  }
}

void CLI::handle_search_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: search <fragment>" << std::endl;
    return;
  }

  const registry::PartialSearchResult result = lookup_.search_partial(args[0]);
  output_ << result.message << std::endl;
  for (const auto& summary : result.results) {
    output_ << "  " << summary.hash_code << " (" << summary.short_code << ")  "
            << summary.document_type_display << "  " << summary.client_name << "  "
            << summary.creation_timestamp << std::endl;
  }
}

void CLI::print_record(const record::DocumentRecord& record) {
  output_ << "  Hash code:     " << record.hash_code << std::endl;
  output_ << "  Short code:    " << record.short_code << std::endl;
  output_ << "  Content hash:  " << (record.content_hash.empty() ? "N/A" : record.content_hash) << std::endl;
  output_ << "  Document type: " << record.document_type_display << std::endl;
  output_ << "  File:          " << record.file_name << " (" << record.file_size << " bytes)" << std::endl;
  output_ << "  Created:       " << record.creation_timestamp << std::endl;
  output_ << "  User:          " << record.owner_namespace << std::endl;
  output_ << "  Client:        " << record.client_name << std::endl;
  for (const auto& [key, value] : record.form_data) {
    output_ << "  " << key << ": " << record::form_value_to_string(value) << std::endl;
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  LOG_ERROR << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace docreg
