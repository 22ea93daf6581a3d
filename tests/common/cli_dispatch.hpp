#ifndef PROBEKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
#define PROBEKIT_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "probekit/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace probekit::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return probekit::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Redirects std::cout/std::cerr into string buffers for the lifetime of the
// object.
class ScopedOutputCapture {
public:
  ScopedOutputCapture()
      : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}

  ~ScopedOutputCapture() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }

  ScopedOutputCapture(const ScopedOutputCapture&) = delete;
  ScopedOutputCapture& operator=(const ScopedOutputCapture&) = delete;

  std::string out() const {
    return out_.str();
  }
  std::string err() const {
    return err_.str();
  }

private:
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf* old_out_ = nullptr;
  std::streambuf* old_err_ = nullptr;
};

inline int DispatchCaptured(const std::vector<std::string>& argv_storage, std::string& out,
                            std::string& err) {
  ScopedOutputCapture capture;
  const int code = DispatchArgs(argv_storage);
  out = capture.out();
  err = capture.err();
  return code;
}

} // namespace probekit::tests::common

#endif // PROBEKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
