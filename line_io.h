// Line-oriented sources and sinks over stdio handles.  -*- c++ -*-
//
// Sources and sinks here finish with an absl::Status, so connecting them
// gives a pipeline whose result says how it ended:
//
//   absl::Status status = RunEffect(StdinLn() | StdoutLn());
//
// A sink treats a reader that went away (EPIPE) as an ordinary request to
// stop. That only happens if the process ignores SIGPIPE; by default the
// signal ends the process first. Nothing in this file changes the signal
// disposition.

#ifndef BISTREAM_LINE_IO_H_
#define BISTREAM_LINE_IO_H_

#include <cstdio>
#include <string>

#include "absl/status/status.h"
#include "composition.h"
#include "step.h"
#include "text_adapters.h"

namespace bistream {

struct LineIoOptions {
  // Separates lines on input and terminates them on output.
  char delimiter = '\n';
  // Flush the handle after every line written. Without it a reader that
  // went away is noticed only when the stdio buffer fills.
  bool flush_each_line = true;
};

// Emits the lines of `handle`, without their delimiter, until end of input.
// Finishes with OkStatus at end of input and with the error otherwise.
// The last line need not be terminated.
Source<std::string, absl::Status> FromHandle(
    std::FILE* handle, LineIoOptions options = LineIoOptions());

Source<std::string, absl::Status> StdinLn();

// Writes every value to `handle` followed by the delimiter. Finishes with
// OkStatus when the reader of `handle` went away, and with the error when a
// write fails for any other reason.
Sink<std::string, absl::Status> ToHandle(
    std::FILE* handle, LineIoOptions options = LineIoOptions());

Sink<std::string, absl::Status> StdoutLn();

// Parses the lines of standard input, dropping the ones that do not parse.
template <typename A>
Source<A, absl::Status> ReadLn() {
  return StdinLn() | Read<A, absl::Status>();
}

// Formats values onto standard output, one per line.
template <typename A>
Sink<A, absl::Status> Print() {
  return Show<A, absl::Status>() | StdoutLn();
}

}  // namespace bistream

#endif  // BISTREAM_LINE_IO_H_
