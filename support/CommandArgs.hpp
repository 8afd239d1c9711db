// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_SUPPORT_COMMAND_ARGS_HPP_INCLUDED
#define NFD_SUPPORT_COMMAND_ARGS_HPP_INCLUDED

#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace support {

class command_args_error : public std::runtime_error {
public:
  explicit command_args_error(const std::string &Message):
    runtime_error(Message)
  {}
};

class command_args {

public:

  // True if --help or -h was given; the help text has already been written by the parser
  bool Help() const { return Help_; }

  bool OptionIsPresent(const std::string &Name) const { return Values_.count(Name) > 0; }

  template <typename T> T GetOptionValue(const std::string &Name, const T &DefaultValue) const {
    static_assert(std::is_same<T, int>::value || std::is_same<T, bool>::value, "Command-line "
      "options hold int or bool values.");
    auto Iter = Values_.find(Name);
    return Iter != Values_.end() ? static_cast<T>(Iter->second) : DefaultValue;
  }

private:

  bool Help_ = false;
  // Flags are stored as 0 or 1
  std::map<std::string, int> Values_;

  friend class command_args_parser;

};

// Accepts --name=value, --name value, -n value and -nvalue for int options; flags take no value
// (or =true/=false/=1/=0 in long form) and may be grouped as in -pq
class command_args_parser {

public:

  command_args_parser(std::string Usage, std::string Description);

  command_args_parser &AddIntOption(const std::string &Name, char ShortName, const std::string
    &Description);
  command_args_parser &AddFlag(const std::string &Name, char ShortName, const std::string
    &Description);

  std::string HelpText() const;

  // First element is the program name
  command_args Parse(const std::vector<std::string> &Args) const;
  command_args Parse(int argc, char **argv) const;

private:

  struct option {
    std::string Name;
    char ShortName;
    bool IsFlag;
    std::string Description;
  };

  std::string Usage_;
  std::string Description_;
  std::vector<option> Options_;

  void AddOption_(const std::string &Name, char ShortName, bool IsFlag, const std::string
    &Description);

  const option *FindOption_(const std::string &Name) const;
  const option *FindOption_(char ShortName) const;

};

}

#endif
