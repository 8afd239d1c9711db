// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_LOGGER_HPP_INCLUDED
#define NFD_CORE_LOGGER_HPP_INCLUDED

#include <nfd/core/Global.hpp>
#include <nfd/core/TextProcessing.hpp>

#include <string>

namespace nfd {
namespace core {

// Status messages go to stdout and are written while the nesting depth is below the verbosity;
// warnings always go to stderr
class logger {

public:

  // Nests subsequent status messages one level deeper until destroyed or ended
  class status_scope {
  public:
    status_scope() = default;
    status_scope(const status_scope &Other) = delete;
    status_scope(status_scope &&Other) noexcept;
    ~status_scope() noexcept { End(); }
    status_scope &operator=(const status_scope &Other) = delete;
    status_scope &operator=(status_scope &&Other) noexcept;
    bool Active() const { return Logger_ != nullptr; }
    void End() noexcept;
  private:
    logger *Logger_ = nullptr;
    explicit status_scope(logger &Logger);
    friend class logger;
  };

  explicit logger(int Verbosity=1):
    Verbosity_(Verbosity)
  {}

  logger(const logger &Other) = delete;
  logger &operator=(const logger &Other) = delete;

  int Verbosity() const { return Verbosity_; }
  logger &SetVerbosity(int Verbosity);

  int StatusDepth() const { return Depth_; }
  bool LoggingStatus() const { return Depth_ < Verbosity_; }

  int WarningCount() const { return WarningCount_; }

  template <typename... Ts> void LogStatus(const std::string &Format, const Ts &... Args);
  template <typename... Ts> void LogWarning(const std::string &Format, const Ts &... Args);

  status_scope BeginStatusScope();

private:

  int Verbosity_;
  int Depth_ = 0;
  int WarningCount_ = 0;

  std::string StatusPrefix_() const;

};

}}

#include <nfd/core/Logger.inl>

#endif
