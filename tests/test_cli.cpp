#include "minitest.hpp"
#include "app/Cli.hpp"
#include <cstdio>
#include <string>
#include <unistd.h>
#include <vector>

using binview::app::run_cli;

namespace {

struct CliResult {
  int status{0};
  std::string err;
};

// Runs the CLI with stderr redirected into a pipe.
CliResult run_capturing_stderr(const std::vector<std::string>& args) {
  CliResult r;
  int fds[2];
  if (::pipe(fds) != 0) { r.status = -1; return r; }
  std::fflush(stderr);
  int saved = ::dup(STDERR_FILENO);
  ::dup2(fds[1], STDERR_FILENO);
  ::close(fds[1]);
  r.status = run_cli(args);
  std::fflush(stderr);
  ::dup2(saved, STDERR_FILENO);
  ::close(saved);
  char buf[512];
  ssize_t n;
  while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) r.err.append(buf, static_cast<size_t>(n));
  ::close(fds[0]);
  return r;
}

} // namespace

TEST(cli_empty_input_is_fatal_with_one_line) {
  auto r = run_capturing_stderr({"/dev/null"});
  ASSERT_EQ(r.status, 1);
  ASSERT_EQ(r.err, std::string("binview: no input data (EOF)\n"));
}

TEST(cli_missing_file_is_fatal_with_one_line) {
  auto r = run_capturing_stderr({"/nonexistent/binview-input"});
  ASSERT_EQ(r.status, 1);
  ASSERT_EQ(r.err.rfind("binview: /nonexistent/binview-input: ", 0), 0u);
  ASSERT_EQ(r.err.back(), '\n');
  ASSERT_EQ(r.err.find('\n'), r.err.size() - 1);
}

TEST(cli_unknown_option_exits_two) {
  auto r = run_capturing_stderr({"--bogus"});
  ASSERT_EQ(r.status, 2);
  ASSERT_EQ(r.err, std::string("binview: unknown option --bogus\n"));
}

TEST(cli_double_dash_treats_rest_as_paths) {
  auto r = run_capturing_stderr({"--", "-x"});
  ASSERT_EQ(r.status, 1);
  ASSERT_EQ(r.err.rfind("binview: -x: ", 0), 0u);
}
