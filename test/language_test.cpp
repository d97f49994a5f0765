#include <gtest/gtest.h>
#include <codnite/language.h>

TEST(LanguageTest, RegistryContainsEveryLanguage) {
  std::vector<std::string> ids;
  for (auto& lang : Languages()) ids.push_back(lang.id);
  EXPECT_EQ(ids, (std::vector<std::string>{"c", "cpp", "python", "javascript", "java"}));
  for (auto& lang : Languages()) {
    EXPECT_FALSE(lang.run_command.empty()) << lang.id;
    EXPECT_GT(lang.time_multiplier, 0) << lang.id;
    EXPECT_GT(lang.memory_multiplier, 0) << lang.id;
    EXPECT_GE(lang.process_limit, 1) << lang.id;
    if (lang.IsCompiled()) EXPECT_GT(lang.compile_timeout_ms, 0) << lang.id;
  }
}

TEST(LanguageTest, LookupIsCaseInsensitive) {
  const LanguageDescriptor* lang = FindLanguage("CPP");
  ASSERT_NE(lang, nullptr);
  EXPECT_EQ(lang->id, "cpp");
  ASSERT_NE(FindLanguage("Java"), nullptr);
  EXPECT_EQ(FindLanguage("Java")->id, "java");
}

TEST(LanguageTest, Aliases) {
  EXPECT_EQ(FindLanguage("c++"), FindLanguage("cpp"));
  EXPECT_EQ(FindLanguage("python3"), FindLanguage("python"));
  EXPECT_EQ(FindLanguage("js"), FindLanguage("javascript"));
  EXPECT_EQ(FindLanguage("node"), FindLanguage("javascript"));
}

TEST(LanguageTest, Unsupported) {
  EXPECT_EQ(FindLanguage("cobol"), nullptr);
  EXPECT_EQ(FindLanguage(""), nullptr);
  EXPECT_EQ(FindLanguage(" cpp"), nullptr);
}

TEST(LanguageTest, InterpretedLanguages) {
  const LanguageDescriptor* js = FindLanguage("javascript");
  ASSERT_NE(js, nullptr);
  EXPECT_FALSE(js->IsCompiled());
  EXPECT_EQ(js->source_name, js->program_name);
  const LanguageDescriptor* cpp = FindLanguage("cpp");
  ASSERT_NE(cpp, nullptr);
  EXPECT_TRUE(cpp->IsCompiled());
}

TEST(LanguageTest, ExpandCommandSubstitutesEveryArgument) {
  std::vector<std::string> tmpl = {"cc", "-o", "{program}", "{source}", "-I{workdir}", "{source}{source}"};
  auto cmd = ExpandCommand(tmpl, {.source = "/w/a.c", .program = "/w/a", .workdir = "/w"});
  EXPECT_EQ(cmd, (std::vector<std::string>{"cc", "-o", "/w/a", "/w/a.c", "-I/w", "/w/a.c/w/a.c"}));
}

TEST(LanguageTest, ExpandCommandKeepsArgumentsIntact) {
  // values are never split on whitespace or interpreted by a shell
  std::vector<std::string> tmpl = {"run", "{program}"};
  auto cmd = ExpandCommand(tmpl, {.source = "", .program = "a b; rm -rf /", .workdir = ""});
  ASSERT_EQ(cmd.size(), 2u);
  EXPECT_EQ(cmd[1], "a b; rm -rf /");
}

TEST(LanguageTest, ExpandCommandReplacementContainingPlaceholder) {
  auto cmd = ExpandCommand({"{source}"}, {.source = "{source}", .program = "", .workdir = ""});
  EXPECT_EQ(cmd, (std::vector<std::string>{"{source}"}));
}
