#ifndef PICAMD_TESTS_COMMON_CLI_DISPATCH_HPP_
#define PICAMD_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "picamd/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace picamd::tests::common {

struct DispatchOutput {
  int exit_code = -1;
  std::string out;
  std::string err;
};

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return picamd::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs the router with stdout/stderr redirected into strings.
inline DispatchOutput DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());

  DispatchOutput output;
  output.exit_code = DispatchArgs(argv_storage);

  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  output.out = captured_out.str();
  output.err = captured_err.str();
  return output;
}

} // namespace picamd::tests::common

#endif // PICAMD_TESTS_COMMON_CLI_DISPATCH_HPP_
