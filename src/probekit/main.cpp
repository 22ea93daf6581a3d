#include "probekit/cli/router.hpp"

int main(int argc, char** argv) {
  return probekit::cli::Dispatch(argc, argv);
}
