// Line-oriented sources and sinks over stdio handles.

#include "line_io.h"

#include <sys/types.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace bistream {
namespace {

using Line = absl::optional<std::string>;

// Reads one line. Returns nullopt at end of input.
absl::StatusOr<Line> ReadLine(std::FILE* handle, char delimiter) {
  char* buffer = nullptr;
  size_t capacity = 0;
  errno = 0;
  ssize_t length = getdelim(&buffer, &capacity, delimiter, handle);
  std::unique_ptr<char, void (*)(void*)> owned(buffer, &std::free);
  if (length < 0) {
    if (std::ferror(handle)) {
      return absl::ErrnoToStatus(errno != 0 ? errno : EIO, "reading a line");
    }
    return Line();
  }
  std::string line(buffer, static_cast<size_t>(length));
  if (!line.empty() && line.back() == delimiter) {
    line.pop_back();
  }
  return Line(std::move(line));
}

// Writes one line. Returns 0 on success and the errno value otherwise.
int WriteLine(std::FILE* handle, absl::string_view line,
              const LineIoOptions& options) {
  errno = 0;
  if (std::fwrite(line.data(), 1, line.size(), handle) != line.size() ||
      std::fputc(options.delimiter, handle) == EOF) {
    return errno != 0 ? errno : EIO;
  }
  if (options.flush_each_line && std::fflush(handle) != 0) {
    return errno != 0 ? errno : EIO;
  }
  return 0;
}

}  // namespace

Source<std::string, absl::Status> FromHandle(std::FILE* handle,
                                             LineIoOptions options) {
  using P = SourcePorts<std::string>;
  return Bind(P::Lift([handle, options] {
                return ReadLine(handle, options.delimiter);
              }),
              [handle, options](absl::StatusOr<Line> line)
                  -> Source<std::string, absl::Status> {
                if (!line.ok()) {
                  return P::Return(line.status());
                }
                if (!line->has_value()) {
                  return P::Return(absl::OkStatus());
                }
                return Bind(P::Emit(std::move(**line)),
                            [handle, options](Unit) {
                              return FromHandle(handle, options);
                            });
              });
}

Source<std::string, absl::Status> StdinLn() { return FromHandle(stdin); }

Sink<std::string, absl::Status> ToHandle(std::FILE* handle,
                                         LineIoOptions options) {
  using P = SinkPorts<std::string>;
  return Bind(P::Await(), [handle, options](std::string line) {
    return Bind(P::Lift([handle, options, line] {
                  return WriteLine(handle, line, options);
                }),
                [handle, options](int error)
                    -> Sink<std::string, absl::Status> {
                  if (error == 0) {
                    return ToHandle(handle, options);
                  }
                  if (error == EPIPE) {
                    return P::Return(absl::OkStatus());
                  }
                  return P::Return(
                      absl::ErrnoToStatus(error, "writing a line"));
                });
  });
}

Sink<std::string, absl::Status> StdoutLn() { return ToHandle(stdout); }

}  // namespace bistream
