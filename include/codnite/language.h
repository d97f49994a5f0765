#ifndef INCLUDE_CODNITE_LANGUAGE_H_
#define INCLUDE_CODNITE_LANGUAGE_H_

#include <string>
#include <vector>

// Toolchain of one language. Commands are argument vectors, never shell strings;
//   the placeholders {source}, {program} and {workdir} are substituted per argument
//   with paths inside the sandbox.
struct LanguageDescriptor {
  std::string id;
  std::string name;
  std::string file_extension;
  std::string source_name; // file the submitted code is written to
  std::string program_name; // file the run command loads; equals source_name if not compiled
  std::vector<std::string> compile_command; // empty if interpreted
  std::vector<std::string> run_command;
  long compile_timeout_ms;
  double time_multiplier;
  double memory_multiplier;
  int process_limit; // RLIMIT_NPROC inside the sandbox
  std::vector<std::string> extra_dirs; // bind mounted in addition to the default toolchain dirs

  bool IsCompiled() const { return !compile_command.empty(); }
};

// The registry is built once and never modified afterwards.
const std::vector<LanguageDescriptor>& Languages();

// Case-insensitive; aliases (c++, python3, js, node) are accepted.
// Return nullptr if the language is not supported.
const LanguageDescriptor* FindLanguage(const std::string& id);

struct CommandVars {
  std::string source, program, workdir;
};

std::vector<std::string> ExpandCommand(const std::vector<std::string>& tmpl, const CommandVars& vars);

#endif  // INCLUDE_CODNITE_LANGUAGE_H_
