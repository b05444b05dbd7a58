#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

namespace util {

inline auto Logging::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("Logging options");
  desc.add_options()
    ("log-filename", po::value<std::string>(&log_filename),
     "log filename. If specified, logs to the file in addition to stdout")
    ("log-append-mode", po::bool_switch(&append_mode), "write log in append mode")
    ("omit-timestamps", po::bool_switch(&omit_timestamps), "omit timestamps");
  return desc;
}

}  // namespace util
