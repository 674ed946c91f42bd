/// @file
/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <gtest/gtest.h>

#include <stdlib.h>
#include <string>
#include <string_view>
#include <vector>

#include <stash/stash.hxx>

STASH_INIT;


int main(int argc, char **argv) {
  // STASH_LOG=debug shows archive session logging
  auto log_level = getenv("STASH_LOG");
  if (log_level != nullptr && std::string_view{log_level} == "debug")
      stash::log::set_level(stash::log::DEBUG);

  // build new arg list
  std::vector<char*> args;
  for (int i=0; i<argc; i++)
      args.push_back(argv[i]);

  // add --gtest_catch_exceptions=0
  args.push_back((new std::string("--gtest_catch_exceptions=0"))->data());

  argc = args.size();
  argv = args.data();

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
