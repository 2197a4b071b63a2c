// Textual parse and format transformers.

#include "text_adapters.h"

#include <cstdint>
#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

namespace bistream {

namespace {

// Leading whitespace is skipped, but a value must run to the end of its text.
bool EndsInValue(absl::string_view text) {
  return !text.empty() && !absl::ascii_isspace(text.back());
}

}  // namespace

bool ParseText(absl::string_view text, std::string* out) {
  out->assign(text.data(), text.size());
  return true;
}

bool ParseText(absl::string_view text, bool* out) {
  return EndsInValue(text) && absl::SimpleAtob(text, out);
}

bool ParseText(absl::string_view text, int32_t* out) {
  return EndsInValue(text) && absl::SimpleAtoi(text, out);
}

bool ParseText(absl::string_view text, int64_t* out) {
  return EndsInValue(text) && absl::SimpleAtoi(text, out);
}

bool ParseText(absl::string_view text, uint32_t* out) {
  return EndsInValue(text) && absl::SimpleAtoi(text, out);
}

bool ParseText(absl::string_view text, uint64_t* out) {
  return EndsInValue(text) && absl::SimpleAtoi(text, out);
}

bool ParseText(absl::string_view text, float* out) {
  return EndsInValue(text) && absl::SimpleAtof(text, out);
}

bool ParseText(absl::string_view text, double* out) {
  return EndsInValue(text) && absl::SimpleAtod(text, out);
}

std::string FormatText(bool value) { return value ? "true" : "false"; }

}  // namespace bistream
