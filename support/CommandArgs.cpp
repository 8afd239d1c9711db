// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "support/CommandArgs.hpp"

#include <nfd/core/TextProcessing.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace support {

namespace {

int ParseInt(const std::string &OptionName, const std::string &Value) {

  const char *Begin = Value.c_str();
  char *End;
  errno = 0;
  long Result = std::strtol(Begin, &End, 10);

  if (Value.empty() || *End != '\0' || errno == ERANGE || Result < INT_MIN || Result > INT_MAX) {
    throw command_args_error(nfd::core::StringPrint("Invalid value '%s' for option --%s; "
      "expected an integer.", Value, OptionName));
  }

  return int(Result);

}

int ParseFlag(const std::string &OptionName, const std::string &Value) {

  if (Value == "true" || Value == "1") return 1;
  if (Value == "false" || Value == "0") return 0;

  throw command_args_error(nfd::core::StringPrint("Invalid value '%s' for flag --%s; expected "
    "true, false, 1 or 0.", Value, OptionName));

}

}

command_args_parser::command_args_parser(std::string Usage, std::string Description):
  Usage_(std::move(Usage)),
  Description_(std::move(Description))
{}

command_args_parser &command_args_parser::AddIntOption(const std::string &Name, char ShortName,
  const std::string &Description) {

  AddOption_(Name, ShortName, false, Description);

  return *this;

}

command_args_parser &command_args_parser::AddFlag(const std::string &Name, char ShortName, const
  std::string &Description) {

  AddOption_(Name, ShortName, true, Description);

  return *this;

}

void command_args_parser::AddOption_(const std::string &Name, char ShortName, bool IsFlag, const
  std::string &Description) {

  if (Name.empty() || Name == "help" || ShortName == 'h' || FindOption_(Name) || (ShortName != '\0'
    && FindOption_(ShortName))) {
    throw command_args_error(nfd::core::StringPrint("Option --%s conflicts with an existing "
      "option.", Name));
  }

  Options_.push_back({Name, ShortName, IsFlag, Description});

}

const command_args_parser::option *command_args_parser::FindOption_(const std::string &Name) const {

  for (auto &Option : Options_) {
    if (Option.Name == Name) return &Option;
  }

  return nullptr;

}

const command_args_parser::option *command_args_parser::FindOption_(char ShortName) const {

  for (auto &Option : Options_) {
    if (Option.ShortName == ShortName) return &Option;
  }

  return nullptr;

}

std::string command_args_parser::HelpText() const {

  std::vector<std::pair<std::string, std::string>> Lines;

  for (auto &Option : Options_) {
    std::string Label = Option.ShortName != '\0' ? std::string("-") + Option.ShortName + ", " :
      "    ";
    Label += "--" + Option.Name;
    if (!Option.IsFlag) Label += " <int>";
    Lines.emplace_back(std::move(Label), Option.Description);
  }
  Lines.emplace_back("-h, --help", "Print this help text and exit");

  std::size_t LabelWidth = 0;
  for (auto &Line : Lines) {
    LabelWidth = std::max(LabelWidth, Line.first.length());
  }

  std::string Text = "Usage: " + Usage_ + "\n\n";
  if (!Description_.empty()) Text += Description_ + "\n\n";
  Text += "Options:\n";
  for (auto &Line : Lines) {
    Text += "  " + Line.first + std::string(LabelWidth - Line.first.length() + 2, ' ') +
      Line.second + "\n";
  }

  return Text;

}

command_args command_args_parser::Parse(const std::vector<std::string> &Args) const {

  command_args CommandArgs;

  for (std::size_t iArg = 1; iArg < Args.size(); ++iArg) {

    const std::string &Arg = Args[iArg];

    auto NextValue = [&](const option &Option) -> const std::string & {
      if (iArg+1 == Args.size()) {
        throw command_args_error(nfd::core::StringPrint("Option --%s requires a value.",
          Option.Name));
      }
      return Args[++iArg];
    };

    if (Arg == "--help" || Arg == "-h") {
      CommandArgs.Help_ = true;
      std::string Text = HelpText();
      std::fputs(Text.c_str(), stdout);
      std::fflush(stdout);
      return CommandArgs;
    }

    if (Arg.compare(0, 2, "--") == 0 && Arg.length() > 2) {

      std::size_t EqualsPos = Arg.find('=');
      std::string Name = Arg.substr(2, EqualsPos == std::string::npos ? std::string::npos :
        EqualsPos-2);
      const option *Option = FindOption_(Name);
      if (!Option) {
        throw command_args_error(nfd::core::StringPrint("Unrecognized option --%s.", Name));
      }

      if (Option->IsFlag) {
        CommandArgs.Values_[Name] = EqualsPos == std::string::npos ? 1 : ParseFlag(Name,
          Arg.substr(EqualsPos+1));
      } else if (EqualsPos != std::string::npos) {
        CommandArgs.Values_[Name] = ParseInt(Name, Arg.substr(EqualsPos+1));
      } else {
        CommandArgs.Values_[Name] = ParseInt(Name, NextValue(*Option));
      }

    } else if (Arg[0] == '-' && Arg.length() > 1) {

      for (std::size_t iChar = 1; iChar < Arg.length(); ++iChar) {
        const option *Option = FindOption_(Arg[iChar]);
        if (!Option) {
          throw command_args_error(nfd::core::StringPrint("Unrecognized option -%c.", Arg[iChar]));
        }
        if (Option->IsFlag) {
          CommandArgs.Values_[Option->Name] = 1;
        } else {
          // Remaining characters, if any, are the value
          if (iChar+1 < Arg.length()) {
            CommandArgs.Values_[Option->Name] = ParseInt(Option->Name, Arg.substr(iChar+1));
          } else {
            CommandArgs.Values_[Option->Name] = ParseInt(Option->Name, NextValue(*Option));
          }
          break;
        }
      }

    } else {

      throw command_args_error(nfd::core::StringPrint("Unexpected argument '%s'.", Arg));

    }

  }

  return CommandArgs;

}

command_args command_args_parser::Parse(int argc, char **argv) const {

  return Parse(std::vector<std::string>(argv, argv+argc));

}

}
