// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include <cstdio>

namespace nfd {
namespace core {

inline logger::status_scope::status_scope(logger &Logger):
  Logger_(&Logger)
{
  ++Logger_->Depth_;
}

inline logger::status_scope::status_scope(status_scope &&Other) noexcept:
  Logger_(Other.Logger_)
{
  Other.Logger_ = nullptr;
}

inline logger::status_scope &logger::status_scope::operator=(status_scope &&Other) noexcept {

  if (&Other != this) {
    End();
    Logger_ = Other.Logger_;
    Other.Logger_ = nullptr;
  }

  return *this;

}

inline void logger::status_scope::End() noexcept {

  if (Logger_) {
    --Logger_->Depth_;
    Logger_ = nullptr;
  }

}

inline logger &logger::SetVerbosity(int Verbosity) {

  Verbosity_ = Verbosity;

  return *this;

}

inline std::string logger::StatusPrefix_() const {

  std::string Prefix = "nfd :: ";
  if (Depth_ > 0) {
    Prefix.append(2*(Depth_-1), ' ');
    Prefix += "* ";
  }

  return Prefix;

}

template <typename... Ts> void logger::LogStatus(const std::string &Format, const Ts &... Args) {

  if (!LoggingStatus()) return;

  std::string Message = StringPrint(Format, Args...);
  std::fprintf(stdout, "%s%s\n", StatusPrefix_().c_str(), Message.c_str());
  std::fflush(stdout);

}

template <typename... Ts> void logger::LogWarning(const std::string &Format, const Ts &... Args) {

  std::string Message = StringPrint(Format, Args...);
  std::fprintf(stderr, "nfd :: WARNING: %s\n", Message.c_str());
  std::fflush(stderr);

  ++WarningCount_;

}

inline logger::status_scope logger::BeginStatusScope() {

  return status_scope(*this);

}

}}
