#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "registry/registration_service.hpp"
#include "registry/lookup_engine.hpp"
#include "registry/integrity_verifier.hpp"

namespace docreg {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(registry::RegistrationService& registration,
      const registry::LookupEngine& lookup,
      const registry::IntegrityVerifier& verifier,
      std::istream& input = std::cin,
      std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();

  // Executes a single command line; returns false when the shell should exit
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  registry::RegistrationService& registration_;
  const registry::LookupEngine& lookup_;
  const registry::IntegrityVerifier& verifier_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_help_command();
  void handle_types_command();
  void handle_generate_command(const std::vector<std::string>& args);
  void handle_register_command(const std::vector<std::string>& args);
  void handle_resolve_command(const std::vector<std::string>& args);
  void handle_verify_command(const std::vector<std::string>& args);
  void handle_search_command(const std::vector<std::string>& args);
  void print_record(const record::DocumentRecord& record);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace docreg
