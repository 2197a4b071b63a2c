// Echoes standard input to standard output up to a line reading "quit".
//
//   $ printf 'a\nb\nquit\nc\n' | line_filter
//   a
//   b

#include <csignal>
#include <string>

#include "../../composition.h"
#include "../../line_io.h"
#include "../../step.h"
#include "../../transformers.h"
#include "absl/log/log.h"
#include "absl/status/status.h"

using bistream::RunEffect;
using bistream::StdinLn;
using bistream::StdoutLn;
using bistream::TakeWhile;
using bistream::Then;
using bistream::TransformerPorts;

int main() {
  // Report a closed stdout as EPIPE instead of dying on the signal.
  std::signal(SIGPIPE, SIG_IGN);

  auto until_quit = Then(
      TakeWhile<std::string>(
          [](const std::string& line) { return line != "quit"; }),
      TransformerPorts<std::string, std::string>::Return(absl::OkStatus()));

  absl::Status status = RunEffect(StdinLn() | until_quit | StdoutLn());
  if (!status.ok()) {
    ABSL_LOG(ERROR) << "line_filter: " << status;
    return 1;
  }
  return 0;
}
