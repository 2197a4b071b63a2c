// Combinators that change the shape of a stream by threading one slot of
// state across a composition boundary.  -*- c++ -*-

#ifndef BISTREAM_EXCHANGE_H_
#define BISTREAM_EXCHANGE_H_

#include <memory>
#include <type_traits>
#include <utility>

#include "absl/types/optional.h"
#include "composition.h"
#include "step.h"

namespace bistream {

//==============================================================================
// TEE
//==============================================================================

// Turns a sink into a transformer that also forwards every value the sink
// accepted further downstream, in order and exactly once.
//
// One slot holds the value most recently handed to the sink. It is emitted
// downstream just before the sink's next await is answered, and once more
// after the sink finishes if it is still pending.
template <typename A, typename R>
Transformer<A, A, R> Tee(const Sink<A, R>& sink) {
  using P = TransformerPorts<A, A>;
  using Held = std::shared_ptr<absl::optional<A>>;
  return Bind(P::Lift([] { return std::make_shared<absl::optional<A>>(); }),
              [sink](Held held) {
    auto flush = [held] {
      return Bind(P::Lift([held] {
                    absl::optional<A> pending = std::move(*held);
                    held->reset();
                    return pending;
                  }),
                  [](absl::optional<A> pending)
                      -> typename P::template StepOf<Unit> {
                    if (!pending.has_value()) {
                      return P::Return();
                    }
                    return P::Emit(std::move(*pending));
                  });
    };
    auto up = [held, flush](Unit) {
      return Bind(flush(), [held](Unit) {
        return Bind(P::Await(), [held](A a) {
          return Bind(P::Perform([held, a] { *held = a; }),
                      [a](Unit) { return P::Return(a); });
        });
      });
    };
    auto forwarded = For(sink, [](const Void& never) {
      return Absurd<typename P::template StepOf<Unit>>(never);
    });
    return Bind(Answer(up, forwarded), [flush](R r) {
      return Bind(flush(), [r](Unit) { return P::Return(r); });
    });
  });
}

//==============================================================================
// GENERALIZE
//==============================================================================

// Widens a one-directional transformer into a bidirectional step. The
// widened interface carries an address of type X both ways: the address
// downstream last acknowledged with (initially `x0`) is the address sent
// with the next upstream request.
//
//   Generalize(Cat, x) === Pull(x)
//   Generalize(f | g, x) === ComposePull(Generalize(f), Generalize(g))(x)
template <typename X, typename A, typename B, typename R>
Step<X, A, X, B, R> Generalize(const Transformer<A, B, R>& pipe, X x0) {
  using P = Ports<X, A, X, B>;
  using UpP = Ports<X, A, Unit, B>;
  return Bind(P::Lift([x0] { return std::make_shared<X>(x0); }),
              [pipe](std::shared_ptr<X> address) {
    auto up = [address](Unit) {
      return Bind(UpP::Lift([address] { return *address; }),
                  [](X x) { return UpP::Request(std::move(x)); });
    };
    auto dn = [address](B b) {
      return Bind(P::Emit(std::move(b)), [address](X x) {
        return P::Perform([address, x] { *address = x; });
      });
    };
    return For(Answer(up, pipe), dn);
  });
}

//==============================================================================
// ZIP
//==============================================================================

// Pairs two sources element by element: pulls one value from `left`, then
// one from `right`, and emits f(l, r). Finishes with the result of the first
// source to finish, without pulling from the other one again.
template <typename F, typename A, typename B, typename R,
          typename C = typename std::decay<decltype(std::declval<F&>()(
              std::declval<A>(), std::declval<B>()))>::type>
Source<C, R> ZipWith(F f, const Source<A, R>& left,
                     const Source<B, R>& right) {
  using P = SourcePorts<C>;
  return Bind(
      P::Lift([left] { return Next(left); }),
      [f, right](NextResult<A, R> l) -> Source<C, R> {
        if (l.done()) {
          return P::Return(std::move(*l.result));
        }
        return Bind(
            P::Lift([right] { return Next(right); }),
            [f, l](NextResult<B, R> r) -> Source<C, R> {
              if (r.done()) {
                return P::Return(std::move(*r.result));
              }
              Source<A, R> rest_of_left = *l.rest;
              Source<B, R> rest_of_right = *r.rest;
              return Bind(P::Emit(f(*l.value, *r.value)),
                          [f, rest_of_left, rest_of_right](Unit) {
                            return ZipWith(f, rest_of_left, rest_of_right);
                          });
            });
      });
}

template <typename A, typename B, typename R>
Source<std::pair<A, B>, R> Zip(const Source<A, R>& left,
                               const Source<B, R>& right) {
  return ZipWith([](const A& a, const B& b) { return std::make_pair(a, b); },
                 left, right);
}

}  // namespace bistream

#endif  // BISTREAM_EXCHANGE_H_
