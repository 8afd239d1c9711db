// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "gtest/gtest.h"

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {

  // Fork a child process to check for hangs
  pid_t ChildProcessID = fork();

  if (ChildProcessID != 0) {

    testing::InitGoogleTest(&argc, argv);

    int Result = RUN_ALL_TESTS();

    // No hang detected; kill child process before it kills us
    if (ChildProcessID > 0) {
      kill(ChildProcessID, SIGKILL);
    }

    return Result;

  } else {

    char *TimeLimitString = getenv("NFD_TEST_TIME_LIMIT");

    int TimeLimit;
    if (TimeLimitString) {
      TimeLimit = std::stoi(TimeLimitString);
    } else {
      // Default to 5 minutes
      TimeLimit = 300;
    }

    sleep(TimeLimit);

    // Hang (maybe) detected; kill parent process
    std::cout << "[  FAILED  ] Test time limit exceeded" << std::endl << std::flush;
    kill(getppid(), SIGKILL);

    return 1;

  }

}
