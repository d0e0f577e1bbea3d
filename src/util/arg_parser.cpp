#include "util/arg_parser.hpp"

#include <stdexcept>

#include "util/log.hpp"

namespace optray {

ArgParser::ArgParser() : mode_(ArgMode::kCompact) {}


void ArgParser::AddArgument(const std::string& name, int value_num) {
  AddArgument(name, value_num, "", "");
}


void ArgParser::AddArgument(const std::string& name, int value_num, const std::string& metavar,
                            const std::string& help_msg) {
  std::string opt_name = name;
  if (opt_name.empty() || opt_name[0] != '-') {
    LOG_WARNING("Argument %s does not start with minus. Prepend one.", name.c_str());
    opt_name = "-" + opt_name;
  }
  options_[opt_name] = Option{ value_num, metavar.empty() ? "val" : metavar, help_msg };
}


void ArgParser::SetArgMode(ArgMode mode) {
  mode_ = mode;
}


std::string ArgParser::Usage(const char* cmd) const {
  std::string usage = "USAGE: ";
  usage += cmd ? cmd : "";
  for (const auto& [name, opt] : options_) {
    std::string term = name;
    if (opt.value_num < 0) {
      term += " [" + opt.metavar + "]...";
    } else {
      for (int i = 0; i < opt.value_num; i++) {
        term += " " + opt.metavar + (opt.value_num > 1 ? std::to_string(i) : "");
      }
    }
    usage += opt.value_num > 0 ? " " + term : " [" + term + "]";
  }

  usage += "\nOPTIONS:";
  for (const auto& [name, opt] : options_) {
    usage += "\n  " + name + ": " + opt.help;
  }
  return usage;
}


bool ArgParser::SplitCompactFlags(const std::string& term, ArgParseResult& result) const {
  for (size_t i = 1; i < term.size(); i++) {
    auto it = options_.find(std::string{ '-', term[i] });
    if (it == options_.end() || it->second.value_num != 0) {
      return false;
    }
  }
  for (size_t i = 1; i < term.size(); i++) {
    result[std::string{ '-', term[i] }].clear();
  }
  return true;
}


void ArgParser::Fail(const char* cmd, const std::string& reason) const {
  LOG_INFO("%s", Usage(cmd).c_str());
  throw std::invalid_argument(reason);
}


ArgParseResult ArgParser::Parse(int argc, char** argv) const {
  const char* cmd = argc > 0 ? argv[0] : nullptr;
  ArgParseResult result{ { "", {} } };

  int i = 1;
  while (i < argc) {
    std::string term = argv[i++];
    auto it = options_.find(term);
    if (it == options_.end()) {
      bool single_minus = term.size() > 1 && term[0] == '-' && term[1] != '-';
      if (single_minus && mode_ == ArgMode::kCompact) {
        if (!SplitCompactFlags(term, result)) {
          Fail(cmd, "unrecognized option " + term);
        }
        result.at("").clear();
      } else {
        result.at("").emplace_back(term);
      }
      continue;
    }

    // A recognized option. Plain arguments before it are not trailing ones.
    result.at("").clear();
    auto& values = result[term];
    values.clear();
    int value_num = it->second.value_num;
    while (i < argc && (value_num < 0 || values.size() < static_cast<size_t>(value_num))) {
      if (options_.count(argv[i])) {
        break;
      }
      values.emplace_back(argv[i++]);
    }
    if (value_num > 0 && values.size() < static_cast<size_t>(value_num)) {
      Fail(cmd, "option " + term + " needs " + std::to_string(value_num) + " value(s)");
    }
  }

  for (const auto& [name, opt] : options_) {
    if (opt.value_num > 0 && !result.count(name)) {
      Fail(cmd, "missing required option " + name);
    }
  }
  return result;
}

}  // namespace optray
