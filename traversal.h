// Strict folds over sources.  -*- c++ -*-
//
// A fold consumes a source to a single value. For a source emitting
// v1..vn and finishing with r:
//
//   Fold(step, begin, done, source)
//       === done(step(...step(step(begin, v1), v2)..., vn))
//   FoldWithResult(step, begin, done, source)
//       === {Fold(step, begin, done, source), r}
//
// The accumulator is evaluated at every element, so a fold runs in
// constant memory however long the source is. The early-stopping folds
// (Head, Find, Any, ...) are a fold or Next over a filtering transformer;
// they stop pulling from the source as soon as the answer is known.

#ifndef BISTREAM_TRAVERSAL_H_
#define BISTREAM_TRAVERSAL_H_

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "absl/types/optional.h"
#include "composition.h"
#include "step.h"
#include "transformers.h"

namespace bistream {

namespace internal {

// The traversal engine. Walks the tagged union directly: no intermediate
// step is built between elements.
template <typename A, typename R, typename X, typename StepFn>
std::pair<X, R> Accumulate(Source<A, R> p, X x, StepFn& step) {
  while (true) {
    switch (p.kind()) {
      case Source<A, R>::Kind::kAwaitUpstream:
        return Absurd<std::pair<X, R>>(p.address());
      case Source<A, R>::Kind::kEmitDownstream:
        x = step(std::move(x), p.value());
        p = p.Continue(Unit());
        break;
      case Source<A, R>::Kind::kEffect:
        p = p.Run();
        break;
      case Source<A, R>::Kind::kDone:
        return std::pair<X, R>(std::move(x), p.result());
    }
  }
}

}  // namespace internal

//==============================================================================
// FOLDS
//==============================================================================

template <typename StepFn, typename X, typename DoneFn, typename A,
          typename R>
auto Fold(StepFn step, X begin, DoneFn done, const Source<A, R>& source)
    -> decltype(done(std::declval<X>())) {
  return done(internal::Accumulate(source, std::move(begin), step).first);
}

template <typename StepFn, typename X, typename DoneFn, typename A,
          typename R>
auto FoldWithResult(StepFn step, X begin, DoneFn done,
                    const Source<A, R>& source)
    -> std::pair<decltype(done(std::declval<X>())), R> {
  std::pair<X, R> folded =
      internal::Accumulate(source, std::move(begin), step);
  return std::make_pair(done(std::move(folded.first)),
                        std::move(folded.second));
}

// A fold whose begin, step and done perform effects. begin runs before the
// source's first effect, step as each value arrives, done after the
// source's last effect.
template <typename StepFn, typename BeginFn, typename DoneFn, typename A,
          typename R>
auto FoldM(StepFn step, BeginFn begin, DoneFn done,
           const Source<A, R>& source)
    -> decltype(done(std::declval<decltype(begin())>())) {
  return done(internal::Accumulate(source, begin(), step).first);
}

template <typename StepFn, typename BeginFn, typename DoneFn, typename A,
          typename R>
auto FoldMWithResult(StepFn step, BeginFn begin, DoneFn done,
                     const Source<A, R>& source)
    -> std::pair<decltype(done(std::declval<decltype(begin())>())), R> {
  auto folded = internal::Accumulate(source, begin(), step);
  return std::make_pair(done(std::move(folded.first)),
                        std::move(folded.second));
}

//==============================================================================
// EARLY-STOPPING FOLDS
//==============================================================================

// The first value, if any. Runs the source only up to that value.
template <typename A, typename R>
absl::optional<A> Head(const Source<A, R>& source) {
  NextResult<A, R> next = Next(source);
  if (next.done()) {
    return absl::nullopt;
  }
  return next.value;
}

// Whether the source finishes without emitting.
template <typename A, typename R>
bool Null(const Source<A, R>& source) {
  return Next(source).done();
}

// The last value, if any.
template <typename A, typename R>
absl::optional<A> Last(const Source<A, R>& source) {
  absl::optional<A> last;
  NextResult<A, R> next = Next(source);
  while (!next.done()) {
    last = std::move(next.value);
    next = Next(*next.rest);
  }
  return last;
}

// The value at position n, if the source gets that far.
template <typename A, typename R>
absl::optional<A> Index(std::size_t n, const Source<A, R>& source) {
  return Head(source | Drop<A, R>(n));
}

template <typename A, typename R, typename Pred>
absl::optional<A> Find(Pred predicate, const Source<A, R>& source) {
  return Head(source | Filter<A, R>(predicate));
}

template <typename A, typename R, typename Pred>
absl::optional<std::size_t> FindIndex(Pred predicate,
                                      const Source<A, R>& source) {
  return Head(source | FindIndices<A, R>(predicate));
}

template <typename A, typename R, typename Pred>
bool All(Pred predicate, const Source<A, R>& source) {
  return Null(source | Filter<A, R>([predicate](const A& a) {
                return !predicate(a);
              }));
}

template <typename A, typename R, typename Pred>
bool Any(Pred predicate, const Source<A, R>& source) {
  return !Null(source | Filter<A, R>(predicate));
}

template <typename R>
bool And(const Source<bool, R>& source) {
  return All([](bool b) { return b; }, source);
}

template <typename R>
bool Or(const Source<bool, R>& source) {
  return Any([](bool b) { return b; }, source);
}

template <typename A, typename R>
bool Elem(const A& value, const Source<A, R>& source) {
  return Any([value](const A& a) { return a == value; }, source);
}

template <typename A, typename R>
bool NotElem(const A& value, const Source<A, R>& source) {
  return All([value](const A& a) { return a != value; }, source);
}

//==============================================================================
// AGGREGATES
//==============================================================================

template <typename A, typename R>
std::size_t Length(const Source<A, R>& source) {
  return Fold([](std::size_t n, const A& /*value*/) { return n + 1; },
              std::size_t{0}, [](std::size_t n) { return n; }, source);
}

template <typename A, typename R>
A Sum(const Source<A, R>& source) {
  return Fold([](A total, const A& a) { return total + a; }, A(0),
              [](A total) { return total; }, source);
}

template <typename A, typename R>
A Product(const Source<A, R>& source) {
  return Fold([](A total, const A& a) { return total * a; }, A(1),
              [](A total) { return total; }, source);
}

template <typename A, typename R>
absl::optional<A> Maximum(const Source<A, R>& source) {
  return Fold(
      [](absl::optional<A> best, const A& a) -> absl::optional<A> {
        if (!best.has_value() || *best < a) {
          return a;
        }
        return best;
      },
      absl::optional<A>(), [](absl::optional<A> best) { return best; },
      source);
}

template <typename A, typename R>
absl::optional<A> Minimum(const Source<A, R>& source) {
  return Fold(
      [](absl::optional<A> best, const A& a) -> absl::optional<A> {
        if (!best.has_value() || a < *best) {
          return a;
        }
        return best;
      },
      absl::optional<A>(), [](absl::optional<A> best) { return best; },
      source);
}

//==============================================================================
// COLLECTING
//==============================================================================

// Collects every value in memory. This gives up the constant-memory
// property of folds: it exists for tests and small examples, and idiomatic
// code consumes values as they are produced instead.
template <typename A, typename R>
std::vector<A> ToList(const Source<A, R>& source) {
  return Fold(
      [](std::vector<A> values, const A& a) {
        values.push_back(a);
        return values;
      },
      std::vector<A>(), [](std::vector<A> values) { return values; }, source);
}

// ToList that also keeps the source's result. Same caveat as ToList.
template <typename A, typename R>
std::pair<std::vector<A>, R> ToListWithResult(const Source<A, R>& source) {
  return FoldWithResult(
      [](std::vector<A> values, const A& a) {
        values.push_back(a);
        return values;
      },
      std::vector<A>(), [](std::vector<A> values) { return values; }, source);
}

}  // namespace bistream

#endif  // BISTREAM_TRAVERSAL_H_
