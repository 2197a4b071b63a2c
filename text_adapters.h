// Textual parse and format transformers.  -*- c++ -*-

#ifndef BISTREAM_TEXT_ADAPTERS_H_
#define BISTREAM_TEXT_ADAPTERS_H_

#include <cstdint>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "composition.h"
#include "step.h"
#include "transformers.h"

namespace bistream {

// Parses the whole of `text` into `*out`. Returns false, leaving `*out`
// unspecified, when `text` is not entirely a value of the target type.
// Numbers and booleans may carry leading whitespace but not trailing
// whitespace.
bool ParseText(absl::string_view text, std::string* out);
bool ParseText(absl::string_view text, bool* out);
bool ParseText(absl::string_view text, int32_t* out);
bool ParseText(absl::string_view text, int64_t* out);
bool ParseText(absl::string_view text, uint32_t* out);
bool ParseText(absl::string_view text, uint64_t* out);
bool ParseText(absl::string_view text, float* out);
bool ParseText(absl::string_view text, double* out);

// Formats a value as text. Total for every type absl::StrCat accepts.
template <typename A>
std::string FormatText(const A& value) {
  return absl::StrCat(value);
}

std::string FormatText(bool value);

// Parses every string into an A, silently dropping the ones that do not
// parse.
template <typename A, typename R = Unit>
Transformer<std::string, A, R> Read() {
  using P = TransformerPorts<std::string, A>;
  return For(Cat<std::string, R>(),
             [](const std::string& text) -> typename P::template StepOf<Unit> {
               A value;
               if (!ParseText(text, &value)) {
                 return P::Return();
               }
               return P::Emit(std::move(value));
             });
}

// Formats every value as a string.
template <typename A, typename R = Unit>
Transformer<A, std::string, R> Show() {
  return Map<A, std::string, R>([](A value) { return FormatText(value); });
}

}  // namespace bistream

#endif  // BISTREAM_TEXT_ADAPTERS_H_
