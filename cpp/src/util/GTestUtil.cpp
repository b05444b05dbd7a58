#include "util/GTestUtil.hpp"

#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// In order to display help options for gtest, we need to call testing::InitGoogleTest() with
// "--help" in argv. However, doing so causes the program to exit immediately after displaying the
// help, which doesn't give us a chance to show help for our own options.
//
// Therefore, we do a specialized scan for "--help" first. If we find it, we print our help, and
// then call the program-exiting testing::InitGoogleTest() call. Our own options are parsed after
// gtest has stripped its flags from argv; anything we don't recognize is left alone.
int launch_gtest(int argc, char** argv) {
  namespace po = boost::program_options;
  util::Logging::Params log_params;

  po::options_description desc("Options");
  desc.add(log_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help") {
      std::cout << desc << std::endl;
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(desc).allow_unregistered().run(), vm);
  po::notify(vm);

  util::Logging::init(log_params);
  return RUN_ALL_TESTS();
}
