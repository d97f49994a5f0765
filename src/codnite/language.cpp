#include <codnite/language.h>

#include <cctype>
#include <algorithm>
#include <unordered_map>

namespace {

std::vector<LanguageDescriptor> BuildLanguages() {
  std::vector<LanguageDescriptor> ret;
  ret.push_back({
    .id = "c",
    .name = "C (GCC, C17)",
    .file_extension = ".c",
    .source_name = "prog.c",
    .program_name = "prog",
    .compile_command = {"/usr/bin/env", "gcc", "-std=c17", "-O2", "-w", "-o", "{program}", "{source}", "-lm"},
    .run_command = {"{program}"},
    .compile_timeout_ms = 30'000,
    .time_multiplier = 1.0,
    .memory_multiplier = 1.0,
    .process_limit = 1,
    .extra_dirs = {},
  });
  ret.push_back({
    .id = "cpp",
    .name = "C++ (GCC, C++17)",
    .file_extension = ".cpp",
    .source_name = "prog.cpp",
    .program_name = "prog",
    .compile_command = {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w", "-o", "{program}", "{source}"},
    .run_command = {"{program}"},
    .compile_timeout_ms = 30'000,
    .time_multiplier = 1.0,
    .memory_multiplier = 1.0,
    .process_limit = 1,
    .extra_dirs = {},
  });
  // note: the paths substituted here never contain quotes
  ret.push_back({
    .id = "python",
    .name = "Python 3",
    .file_extension = ".py",
    .source_name = "prog.py",
    .program_name = "prog.pyc",
    .compile_command = {"/usr/bin/env", "python3", "-c",
        "import py_compile;py_compile.compile('''{source}''','''{program}''',doraise=True)"},
    .run_command = {"/usr/bin/env", "python3", "{program}"},
    .compile_timeout_ms = 10'000,
    .time_multiplier = 1.0,
    .memory_multiplier = 1.0,
    .process_limit = 1,
    .extra_dirs = {},
  });
  ret.push_back({
    .id = "javascript",
    .name = "JavaScript (Node.js)",
    .file_extension = ".js",
    .source_name = "prog.js",
    .program_name = "prog.js",
    .compile_command = {},
    .run_command = {"/usr/bin/env", "node", "{program}"},
    .compile_timeout_ms = 0,
    .time_multiplier = 1.0,
    .memory_multiplier = 2.0,
    .process_limit = 16, // libuv worker threads
    .extra_dirs = {},
  });
  ret.push_back({
    .id = "java",
    .name = "Java",
    .file_extension = ".java",
    .source_name = "Main.java",
    .program_name = "Main.class",
    .compile_command = {"/usr/bin/env", "javac", "-encoding", "UTF-8", "-d", "{workdir}", "{source}"},
    .run_command = {"/usr/bin/env", "java", "-Xss64m", "-XX:-UsePerfData", "-cp", "{workdir}", "Main"},
    .compile_timeout_ms = 30'000,
    .time_multiplier = 1.0,
    .memory_multiplier = 2.0,
    .process_limit = 64, // JVM threads count towards RLIMIT_NPROC
    // jvm.cfg and security settings are symlinked here on Debian-based hosts
    .extra_dirs = {"/etc/java-11-openjdk", "/etc/java-17-openjdk", "/etc/java-21-openjdk"},
  });
  return ret;
}

inline std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

const std::unordered_map<std::string, size_t>& LanguageIndex() {
  static const std::unordered_map<std::string, size_t> index = []() {
    std::unordered_map<std::string, size_t> ret;
    const auto& langs = Languages();
    for (size_t i = 0; i < langs.size(); i++) ret[langs[i].id] = i;
    const std::pair<const char*, const char*> aliases[] = {
      {"c++", "cpp"},
      {"python3", "python"},
      {"js", "javascript"},
      {"node", "javascript"},
    };
    for (auto& [alias, id] : aliases) ret[alias] = ret.at(id);
    return ret;
  }();
  return index;
}

void ReplaceAll(std::string& str, const std::string& from, const std::string& to) {
  for (size_t pos = 0; (pos = str.find(from, pos)) != std::string::npos; pos += to.size()) {
    str.replace(pos, from.size(), to);
  }
}

} // namespace

const std::vector<LanguageDescriptor>& Languages() {
  static const std::vector<LanguageDescriptor> languages = BuildLanguages();
  return languages;
}

const LanguageDescriptor* FindLanguage(const std::string& id) {
  const auto& index = LanguageIndex();
  auto it = index.find(ToLower(id));
  if (it == index.end()) return nullptr;
  return &Languages()[it->second];
}

std::vector<std::string> ExpandCommand(const std::vector<std::string>& tmpl, const CommandVars& vars) {
  std::vector<std::string> ret;
  ret.reserve(tmpl.size());
  for (const auto& arg : tmpl) {
    std::string str = arg;
    ReplaceAll(str, "{source}", vars.source);
    ReplaceAll(str, "{program}", vars.program);
    ReplaceAll(str, "{workdir}", vars.workdir);
    ret.push_back(std::move(str));
  }
  return ret;
}
