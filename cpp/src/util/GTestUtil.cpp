#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <cstring>
#include <iostream>

namespace {

struct HelpRequest {
  bool help = false;
  bool help_full = false;
};

// testing::InitGoogleTest() consumes --help for itself, and our parser rejects the --gtest_*
// options, so help has to be detected by hand before either of them runs.
HelpRequest scan_for_help(int argc, char** argv) {
  HelpRequest request;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help-full") == 0) {
      request.help_full = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      request.help = true;
    }
  }
  return request;
}

}  // namespace

int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;
  util::Random::Params random_params;
  log_params.omit_timestamps = true;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.add_option<"help", 'h'>("help (most used options)")
                .add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  HelpRequest request = scan_for_help(argc, argv);
  if (request.help || request.help_full) {
    po2::Settings::help_full = request.help_full;
    std::cout << desc << std::endl;

    // gtest only knows --help. It prints its own options and does not run any test.
    char* gtest_argv[] = {argv[0], const_cast<char*>("--help"), nullptr};
    int gtest_argc = 2;
    testing::InitGoogleTest(&gtest_argc, gtest_argv);
    return 0;
  }

  // Strips the --gtest_* options from argv, leaving ours for parse_args().
  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
