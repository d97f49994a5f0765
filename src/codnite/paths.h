#ifndef PATHS_H_
#define PATHS_H_

#include <codnite/paths.h>
#include <codnite/language.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// if inside_box = true, id (and test index) is not used
// those calls will have id (and test index) marked as -1
fs::path CompileBoxPath(long id);
fs::path CompileBoxSource(long id, const LanguageDescriptor& lang, bool inside_box = false);
fs::path CompileBoxProgram(long id, const LanguageDescriptor& lang, bool inside_box = false);
fs::path CompileBoxOutput(long id, bool inside_box = false);
fs::path CompileBoxError(long id, bool inside_box = false);
fs::path ExecuteBoxPath(long id, int test);
fs::path ExecuteBoxProgram(long id, int test, const LanguageDescriptor& lang, bool inside_box = false);
fs::path ExecuteBoxInput(long id, int test, bool inside_box = false);
fs::path ExecuteBoxOutput(long id, int test, bool inside_box = false);
fs::path ExecuteBoxError(long id, int test, bool inside_box = false);

#endif  // PATHS_H_
