#ifndef SRC_UTIL_ARG_PARSER_H_
#define SRC_UTIL_ARG_PARSER_H_

#include <map>
#include <string>
#include <vector>

namespace optray {

enum class ArgMode {
  kCompact,
  kNormal,
};


using ArgParseResult = std::map<std::string, std::vector<std::string>>;

/**
 * @brief A parser to parse command line arguments.
 *
 * A typical call of the tracer looks like:
 * ~~~bash
 * optray_trace -vd -f scene.json
 * ~~~
 * `-v` and `-d` are flags without value, here grouped in the compact form `-vd`. `-f` is a key-value
 * option. Options starting with `--` are always full option names.
 *
 * In ArgMode::kCompact (default) a single-minus term that is not a registered option is split into
 * single letter flags, each of which must be a registered option without value. In ArgMode::kNormal
 * such a term is a plain argument.
 *
 * An option with value number n takes exactly the n following terms. A negative value number takes
 * terms until the next registered option. Plain arguments after the last option are collected under
 * the empty string key.
 *
 * An option registered with a positive value number is required. Parse() throws std::invalid_argument
 * when a required option is missing or the terms cannot be recognized.
 */
class ArgParser {
 public:
  ArgParser();

  void AddArgument(const std::string& name, int value_num);
  void AddArgument(const std::string& name, int value_num, const std::string& metavar, const std::string& help_msg);
  void SetArgMode(ArgMode mode);
  ArgParseResult Parse(int argc, char** argv) const;

  std::string Usage(const char* cmd) const;

 private:
  struct Option {
    int value_num;
    std::string metavar;
    std::string help;
  };

  bool SplitCompactFlags(const std::string& term, ArgParseResult& result) const;
  [[noreturn]] void Fail(const char* cmd, const std::string& reason) const;

  ArgMode mode_;
  std::map<std::string, Option> options_;
};

}  // namespace optray

#endif  // SRC_UTIL_ARG_PARSER_H_
