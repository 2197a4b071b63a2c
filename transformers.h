// Everyday sources, sinks and transformers.  -*- c++ -*-
//
// These are one-line consequences of the core model. They are written only
// in terms of Ports, Bind and the composition algebras, and the laws noted
// on each follow from the laws of those.

#ifndef BISTREAM_TRANSFORMERS_H_
#define BISTREAM_TRANSFORMERS_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "absl/types/optional.h"
#include "composition.h"
#include "step.h"

namespace bistream {

// A source never awaits, so it fits under any upstream interface.
template <typename UA, typename UR, typename B, typename R>
Step<UA, UR, Unit, B, R> WithUpstream(const Source<B, R>& source) {
  return Answer(
      [](const Void& never) {
        return Absurd<Step<UA, UR, Unit, B, Unit>>(never);
      },
      source);
}

//==============================================================================
// SOURCES
//==============================================================================

namespace internal {

template <typename A>
Source<A, Unit> EachFrom(std::shared_ptr<const std::vector<A>> values,
                         std::size_t i) {
  using P = SourcePorts<A>;
  if (i == values->size()) {
    return P::Return();
  }
  return Bind(P::Emit((*values)[i]), [values, i](Unit) {
    return EachFrom(values, i + 1);
  });
}

template <typename A, typename S>
Source<A, Unit> UnfoldFrom(
    std::shared_ptr<const std::function<absl::optional<std::pair<A, S>>(S)>>
        step,
    S seed) {
  using P = SourcePorts<A>;
  return Bind(P::Lift([step, seed] { return (*step)(seed); }),
              [step](absl::optional<std::pair<A, S>> next) -> Source<A, Unit> {
                if (!next.has_value()) {
                  return P::Return();
                }
                S rest = next->second;
                return Bind(P::Emit(next->first), [step, rest](Unit) {
                  return UnfoldFrom(step, rest);
                });
              });
}

}  // namespace internal

// Emits each element of `values` in order.
template <typename A>
Source<A, Unit> Each(std::vector<A> values) {
  return internal::EachFrom(
      std::make_shared<const std::vector<A>>(std::move(values)), 0);
}

// Emits the result of running `action`, forever.
template <typename A, typename R = Unit>
Source<A, R> RepeatM(std::function<A()> action) {
  return Feed(SourcePorts<A>::Lift(action), Cat<A, R>());
}

// Runs `action` and emits its result n times.
//   ReplicateM(m + n, x) === Then(ReplicateM(m, x), ReplicateM(n, x))
template <typename A>
Source<A, Unit> ReplicateM(std::size_t n, std::function<A()> action);

// Emits the values produced by repeatedly stepping a seed, until `step`
// returns nothing.
template <typename A, typename S>
Source<A, Unit> Unfoldr(
    std::function<absl::optional<std::pair<A, S>>(S)> step, S seed) {
  return internal::UnfoldFrom(
      std::make_shared<const std::function<absl::optional<std::pair<A, S>>(S)>>(
          std::move(step)),
      std::move(seed));
}

//==============================================================================
// SINKS
//==============================================================================

// Discards every value.
template <typename A, typename R = Unit>
Sink<A, R> Drain() {
  return For(Cat<A, R>(), [](const A& /*discarded*/) {
    return SinkPorts<A>::Return();
  });
}

// Runs `f` on every value.
template <typename A, typename R = Unit>
Sink<A, R> Consume(std::function<void(const A&)> f) {
  return For(Cat<A, R>(), [f](A a) {
    return SinkPorts<A>::Perform([f, a] { f(a); });
  });
}

//==============================================================================
// TRANSFORMERS
//==============================================================================

// Applies a function to every value.
//   Map(id) === Cat
//   Map(g . f) === Map(f) | Map(g)
template <typename A, typename B, typename R = Unit>
Transformer<A, B, R> Map(Fn<A, B> f) {
  return For(Cat<A, R>(), [f](A a) {
    return TransformerPorts<A, B>::Emit(f(std::move(a)));
  });
}

// Map with an effectful function, run when the value passes.
template <typename A, typename B, typename R = Unit>
Transformer<A, B, R> MapM(Fn<A, B> f) {
  using P = TransformerPorts<A, B>;
  return For(Cat<A, R>(), [f](A a) {
    return Bind(P::Lift([f, a] { return f(a); }),
                [](B b) { return P::Emit(std::move(b)); });
  });
}

// Turns a stream of actions into the stream of their results.
template <typename A, typename R = Unit>
Transformer<std::function<A()>, A, R> Sequence() {
  return MapM<std::function<A()>, A, R>(
      [](const std::function<A()>& action) { return action(); });
}

// Maps each value to a sequence and emits its elements.
template <typename A, typename B, typename R = Unit>
Transformer<A, B, R> MapEach(Fn<A, std::vector<B>> f) {
  return For(Cat<A, R>(), [f](A a) {
    return WithUpstream<Unit, A>(Each(f(std::move(a))));
  });
}

// Flattens a stream of sequences.
template <typename A, typename R = Unit>
Transformer<std::vector<A>, A, R> Concat() {
  return MapEach<std::vector<A>, A, R>(
      [](std::vector<A> values) { return values; });
}

// Forwards only the values satisfying `predicate`.
//   Filter(always true) === Cat
//   Filter(p1 && p2) === Filter(p1) | Filter(p2)
template <typename A, typename R = Unit>
Transformer<A, A, R> Filter(std::function<bool(const A&)> predicate) {
  using P = TransformerPorts<A, A>;
  return For(Cat<A, R>(),
             [predicate](A a) -> typename P::template StepOf<Unit> {
               if (predicate(a)) {
                 return P::Emit(std::move(a));
               }
               return P::Return();
             });
}

// Filter with an effectful predicate.
template <typename A, typename R = Unit>
Transformer<A, A, R> FilterM(std::function<bool(const A&)> predicate) {
  using P = TransformerPorts<A, A>;
  return For(Cat<A, R>(), [predicate](A a) {
    return Bind(P::Lift([predicate, a] { return predicate(a); }),
                [a](bool keep) -> typename P::template StepOf<Unit> {
                  if (keep) {
                    return P::Emit(a);
                  }
                  return P::Return();
                });
  });
}

// Lets n values through, then finishes without awaiting another.
//   Take(0) === Return()
//   Take(min(m, n)) === Take(m) | Take(n)
template <typename A>
Transformer<A, A, Unit> Take(std::size_t n) {
  using P = TransformerPorts<A, A>;
  if (n == 0) {
    return P::Return();
  }
  return Bind(P::Await(), [n](A a) {
    return Bind(P::Emit(std::move(a)), [n](Unit) { return Take<A>(n - 1); });
  });
}

// Lets values through while they satisfy `predicate`; finishes with the
// first value that does not.
template <typename A>
Transformer<A, A, A> TakeWhileReturning(
    std::function<bool(const A&)> predicate) {
  using P = TransformerPorts<A, A>;
  return Bind(P::Await(), [predicate](A a) -> Transformer<A, A, A> {
    if (!predicate(a)) {
      return P::Return(std::move(a));
    }
    return Bind(P::Emit(std::move(a)), [predicate](Unit) {
      return TakeWhileReturning<A>(predicate);
    });
  });
}

// Lets values through while they satisfy `predicate`.
//   TakeWhile(p1 && p2) === TakeWhile(p1) | TakeWhile(p2)
template <typename A>
Transformer<A, A, Unit> TakeWhile(std::function<bool(const A&)> predicate) {
  return Then(TakeWhileReturning<A>(std::move(predicate)),
              TransformerPorts<A, A>::Return());
}

// Discards the first n values.
//   Drop(0) === Cat
//   Drop(m + n) === Drop(m) | Drop(n)
template <typename A, typename R = Unit>
Transformer<A, A, R> Drop(std::size_t n) {
  using P = TransformerPorts<A, A>;
  if (n == 0) {
    return Cat<A, R>();
  }
  return Bind(P::Await(),
              [n](const A& /*dropped*/) { return Drop<A, R>(n - 1); });
}

// Discards values until one fails `predicate`, then forwards everything.
template <typename A, typename R = Unit>
Transformer<A, A, R> DropWhile(std::function<bool(const A&)> predicate) {
  using P = TransformerPorts<A, A>;
  return Bind(P::Await(), [predicate](A a) -> Transformer<A, A, R> {
    if (predicate(a)) {
      return DropWhile<A, R>(predicate);
    }
    return Bind(P::Emit(std::move(a)), [](Unit) { return Cat<A, R>(); });
  });
}

namespace internal {

template <typename A, typename R>
Transformer<A, std::size_t, R> FindIndicesFrom(
    std::function<bool(const A&)> predicate, std::size_t n) {
  using P = TransformerPorts<A, std::size_t>;
  return Bind(P::Await(), [predicate, n](const A& a) {
    auto rest = [predicate, n](Unit) {
      return FindIndicesFrom<A, R>(predicate, n + 1);
    };
    return predicate(a) ? Bind(P::Emit(n), rest) : Bind(P::Return(), rest);
  });
}

}  // namespace internal

// Emits the positions of the values satisfying `predicate`.
template <typename A, typename R = Unit>
Transformer<A, std::size_t, R> FindIndices(
    std::function<bool(const A&)> predicate) {
  return internal::FindIndicesFrom<A, R>(std::move(predicate), 0);
}

// Emits the positions of the values equal to `value`.
template <typename A, typename R = Unit>
Transformer<A, std::size_t, R> ElemIndices(A value) {
  return FindIndices<A, R>([value](const A& a) { return a == value; });
}

namespace internal {

template <typename A, typename B, typename X, typename R>
Transformer<A, B, R> ScanFrom(std::function<X(X, A)> step,
                              std::function<B(const X&)> done, X x) {
  using P = TransformerPorts<A, B>;
  B b = done(x);
  return Bind(P::Emit(std::move(b)), [step, done, x](Unit) {
    return Bind(P::Await(), [step, done, x](A a) {
      return ScanFrom<A, B, X, R>(step, done, step(x, std::move(a)));
    });
  });
}

template <typename A, typename B, typename X, typename R>
Transformer<A, B, R> ScanMFrom(std::function<X(X, A)> step,
                               std::function<B(const X&)> done, X x) {
  using P = TransformerPorts<A, B>;
  return Bind(P::Lift([done, x] { return done(x); }), [step, done, x](B b) {
    return Bind(P::Emit(std::move(b)), [step, done, x](Unit) {
      return Bind(P::Await(), [step, done, x](A a) {
        return Bind(P::Lift([step, x, a] { return step(x, a); }),
                    [step, done](X next) {
                      return ScanMFrom<A, B, X, R>(step, done,
                                                   std::move(next));
                    });
      });
    });
  });
}

}  // namespace internal

// Strict left scan: emits done(begin), then done of every intermediate
// accumulator.
template <typename A, typename B, typename X, typename R = Unit>
Transformer<A, B, R> Scan(std::function<X(X, A)> step, X begin,
                          std::function<B(const X&)> done) {
  return internal::ScanFrom<A, B, X, R>(std::move(step), std::move(done),
                                        std::move(begin));
}

// Scan whose begin, step and done perform effects, in stream order.
template <typename A, typename B, typename X, typename R = Unit>
Transformer<A, B, R> ScanM(std::function<X(X, A)> step,
                           std::function<X()> begin,
                           std::function<B(const X&)> done) {
  using P = TransformerPorts<A, B>;
  return Bind(P::Lift(begin), [step, done](X x) {
    return internal::ScanMFrom<A, B, X, R>(step, done, std::move(x));
  });
}

// Runs `f` on every value before forwarding it.
//   Chain(f then g) === Chain(f) | Chain(g)
template <typename A, typename R = Unit>
Transformer<A, A, R> Chain(std::function<void(const A&)> f) {
  using P = TransformerPorts<A, A>;
  return For(Cat<A, R>(), [f](A a) {
    return Bind(P::Perform([f, a] { f(a); }),
                [a](Unit) { return P::Emit(a); });
  });
}

template <typename A>
Source<A, Unit> ReplicateM(std::size_t n, std::function<A()> action) {
  return Feed(SourcePorts<A>::Lift(action), Take<A>(n));
}

}  // namespace bistream

#endif  // BISTREAM_TRANSFORMERS_H_
