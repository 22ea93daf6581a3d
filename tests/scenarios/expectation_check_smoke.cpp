#include "scenarios/expectation_check.hpp"

#include "../common/assertions.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace {

using probekit::tests::common::AssertContains;
using probekit::tests::common::Fail;

probekit::probe::ProbeResponse MakeResponse(int status, std::string body) {
  probekit::probe::ProbeResponse response;
  response.status_code = status;
  response.body = std::move(body);
  response.headers = {{"Content-Type", "application/json"}, {"X-Frame-Options", "DENY"}};
  return response;
}

} // namespace

int main() {
  using probekit::scenarios::CheckDefaultSuccess;
  using probekit::scenarios::CheckExpectation;
  using probekit::scenarios::Expectation;
  using probekit::scenarios::ExpectationVerdict;
  using probekit::scenarios::StatusCodeRange;

  const auto fast = std::chrono::microseconds(12'400);

  {
    Expectation expectation;
    if (!expectation.empty()) {
      Fail("default expectation should be empty");
    }
    const ExpectationVerdict verdict =
        CheckExpectation(expectation, MakeResponse(503, ""), fast);
    if (!verdict.passed) {
      Fail("empty expectation accepts any completed call");
    }
  }

  {
    Expectation expectation;
    expectation.status_code = 200;
    expectation.status_code_range = StatusCodeRange{200, 299};
    expectation.body_contains = {"\"ok\":true"};
    expectation.body_not_contains = {"password"};
    expectation.header_contains = {{"content-type", "application/json"}};
    expectation.headers_not_present = {"Server"};
    expectation.max_duration_ms = 50;

    const ExpectationVerdict verdict =
        CheckExpectation(expectation, MakeResponse(200, "{\"ok\":true}"), fast);
    if (!verdict.passed || !verdict.failures.empty()) {
      Fail("expected every check to pass: " + verdict.Message());
    }
  }

  {
    // Every mismatch is reported in fixed order and joined with "; ".
    Expectation expectation;
    expectation.status_code = 200;
    expectation.status_code_range = StatusCodeRange{200, 299};
    expectation.body_contains = {"welcome"};
    expectation.body_not_contains = {"stack trace"};
    expectation.header_contains = {{"Content-Type", "text/html"}, {"X-Missing", "1"}};
    expectation.headers_not_present = {"x-frame-options"};
    expectation.max_duration_ms = 10;

    const ExpectationVerdict verdict =
        CheckExpectation(expectation, MakeResponse(500, "stack trace here"), fast);
    if (verdict.passed || verdict.failures.size() != 8U) {
      Fail("expected 8 mismatches, got " + std::to_string(verdict.failures.size()));
    }
    const std::string message = verdict.Message();
    if (message !=
        "status code mismatch: expected 200, got 500; "
        "status code 500 out of range [200-299]; "
        "body missing expected string: 'welcome'; "
        "body contains forbidden string: 'stack trace'; "
        "header 'Content-Type': expected to contain 'text/html', got 'application/json'; "
        "header 'X-Missing' not found; "
        "header 'x-frame-options' should not be present; "
        "response time 12ms exceeded max 10ms") {
      Fail("unexpected mismatch message: " + message);
    }
  }

  {
    // Header values match by substring, so media type parameters are tolerated.
    Expectation expectation;
    expectation.header_contains = {{"Content-Type", "application/json"}};
    probekit::probe::ProbeResponse response = MakeResponse(200, "");
    response.headers["Content-Type"] = "application/json; charset=utf-8";
    if (!CheckExpectation(expectation, response, fast).passed) {
      Fail("header value with charset should satisfy a media type expectation");
    }

    expectation.header_contains = {{"Content-Type", "charset=latin1"}};
    const ExpectationVerdict verdict = CheckExpectation(expectation, response, fast);
    if (verdict.passed) {
      Fail("header value without the expected substring must fail");
    }
    AssertContains(verdict.Message(), "expected to contain 'charset=latin1'");
  }

  {
    // Status 0 in the expectation means "any status".
    Expectation expectation;
    expectation.status_code = 0;
    if (!CheckExpectation(expectation, MakeResponse(418, ""), fast).passed) {
      Fail("status 0 should not constrain the response");
    }
  }

  {
    if (!CheckDefaultSuccess(MakeResponse(204, "")).passed ||
        !CheckDefaultSuccess(MakeResponse(302, "")).passed) {
      Fail("2xx and 3xx are successful by default");
    }
    const ExpectationVerdict verdict = CheckDefaultSuccess(MakeResponse(404, ""));
    if (verdict.passed) {
      Fail("404 is not successful by default");
    }
    AssertContains(verdict.Message(), "unexpected status code 404");
  }

  return 0;
}
