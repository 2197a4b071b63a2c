// Composition algebras over steps.  -*- c++ -*-
//
// Two substitution algebras and two streaming algebras:
//
//   For(p, f)         p //> f    each emission of p is replaced by f(value)
//   Answer(f, p)      f >\\ p    each await of p is replaced by f(address)
//   PullFrom(f, p)    f +>> p    p drives; its awaits pull from f
//   PushInto(p, f)    p >>~ f    p drives; its emissions push into f
//
// and Connect(p1, p2) (p1 >-> p2, also p1 | p2) for the common case where
// the upstream stage needs no address to start.
//
// Each algebra is associative and has a two-sided identity:
//
//   For:      Emit                 For(Emit(x), f) === f(x)
//                                  For(p, Emit)    === p
//   Answer:   Request              Answer(f, Request(x)) === f(x)
//                                  Answer(Request, p)    === p
//   PullFrom: Pull                 PullFrom(Pull, p)  === p
//   PushInto: Push                 PushInto(p, Push)  === p
//   Connect:  Cat                  Connect(Cat, p) === Connect(p, Cat) === p

#ifndef BISTREAM_COMPOSITION_H_
#define BISTREAM_COMPOSITION_H_

#include <memory>
#include <type_traits>
#include <utility>

#include "absl/types/optional.h"
#include "step.h"

namespace bistream {

//==============================================================================
// Composers. These walk the tagged union; everything outside this file and
// the traversal engine goes through the public operations instead.
//==============================================================================

namespace internal {

// p //> f
template <typename In, typename Out>
struct RespondComposer {
  using Body = RebindResult<Out, typename In::down_address_type>;
  using Handler = Fn<typename In::down_value_type, Body>;

  static Out Go(const In& p, const std::shared_ptr<const Handler>& f) {
    switch (p.kind()) {
      case In::Kind::kAwaitUpstream:
        return Out::AwaitUpstream(
            p.address(), [p, f](typename In::up_reply_type x) {
              return Go(p.Receive(std::move(x)), f);
            });
      case In::Kind::kEmitDownstream:
        return Bind((*f)(p.value()),
                    [p, f](typename In::down_address_type b1) {
                      return Go(p.Continue(std::move(b1)), f);
                    });
      case In::Kind::kEffect:
        return Out::Effect([p, f] { return Go(p.Run(), f); });
      case In::Kind::kDone:
        break;
    }
    return Out::Done(p.result());
  }
};

// f >\\ p
template <typename In, typename Out>
struct RequestComposer {
  using Body = RebindResult<Out, typename In::up_reply_type>;
  using Handler = Fn<typename In::up_address_type, Body>;

  static Out Go(const In& p, const std::shared_ptr<const Handler>& f) {
    switch (p.kind()) {
      case In::Kind::kAwaitUpstream:
        return Bind((*f)(p.address()), [p, f](typename In::up_reply_type b) {
          return Go(p.Receive(std::move(b)), f);
        });
      case In::Kind::kEmitDownstream:
        return Out::EmitDownstream(
            p.value(), [p, f](typename In::down_address_type y1) {
              return Go(p.Continue(std::move(y1)), f);
            });
      case In::Kind::kEffect:
        return Out::Effect([p, f] { return Go(p.Run(), f); });
      case In::Kind::kDone:
        break;
    }
    return Out::Done(p.result());
  }
};

// Up's downstream interface is Down's upstream interface. Push and Pull
// hand control to each other at every exchanged value; those hand-offs are
// deferred into Effect thunks so a long conversation never deepens the
// call stack.
template <typename Up, typename Down>
struct StreamComposer {
  using Out = Step<typename Up::up_address_type, typename Up::up_reply_type,
                   typename Down::down_address_type,
                   typename Down::down_value_type, typename Up::result_type>;
  using B1 = typename Up::down_address_type;
  using B = typename Up::down_value_type;
  using UpHandler = Fn<B1, Up>;
  using DownHandler = Fn<B, Down>;

  // p >>~ fb
  static Out Push(const Up& p, const std::shared_ptr<const DownHandler>& fb) {
    switch (p.kind()) {
      case Up::Kind::kAwaitUpstream:
        return Out::AwaitUpstream(
            p.address(), [p, fb](typename Up::up_reply_type a) {
              return Push(p.Receive(std::move(a)), fb);
            });
      case Up::Kind::kEmitDownstream:
        return Out::Effect([p, fb] {
          std::shared_ptr<const UpHandler> resume =
              std::make_shared<const UpHandler>(
                  [p](B1 b1) { return p.Continue(std::move(b1)); });
          return Pull(resume, (*fb)(p.value()));
        });
      case Up::Kind::kEffect:
        return Out::Effect([p, fb] { return Push(p.Run(), fb); });
      case Up::Kind::kDone:
        break;
    }
    return Out::Done(p.result());
  }

  // fb1 +>> p
  static Out Pull(const std::shared_ptr<const UpHandler>& fb1,
                  const Down& p) {
    switch (p.kind()) {
      case Down::Kind::kAwaitUpstream:
        return Out::Effect([fb1, p] {
          std::shared_ptr<const DownHandler> resume =
              std::make_shared<const DownHandler>(
                  [p](B b) { return p.Receive(std::move(b)); });
          return Push((*fb1)(p.address()), resume);
        });
      case Down::Kind::kEmitDownstream:
        return Out::EmitDownstream(
            p.value(), [fb1, p](typename Down::down_address_type c1) {
              return Pull(fb1, p.Continue(std::move(c1)));
            });
      case Down::Kind::kEffect:
        return Out::Effect([fb1, p] { return Pull(fb1, p.Run()); });
      case Down::Kind::kDone:
        break;
    }
    return Out::Done(p.result());
  }
};

}  // namespace internal

//==============================================================================
// SUBSTITUTION ALGEBRAS
//==============================================================================

// Pull algebra: replaces every emission of `p` with handler(value). The
// handler's result is the acknowledgement `p` resumes with.
template <typename UA, typename UR, typename DA, typename DV, typename R,
          typename F, typename H = StepResultOf<F, DV>>
RebindResult<H, R> For(const Step<UA, UR, DA, DV, R>& p, F handler) {
  using In = Step<UA, UR, DA, DV, R>;
  using Out = RebindResult<H, R>;
  static_assert(std::is_same<typename H::up_address_type, UA>::value &&
                    std::is_same<typename H::up_reply_type, UR>::value,
                "the handler must share the stream's upstream interface");
  static_assert(std::is_same<typename H::result_type, DA>::value,
                "the handler must finish with the stream's acknowledgement");
  using Composer = internal::RespondComposer<In, Out>;
  return Composer::Go(p, std::make_shared<const typename Composer::Handler>(
                             std::move(handler)));
}

// Push algebra: replaces every await of `p` with handler(address). The
// handler's result is the answer `p` resumes with.
template <typename F, typename B1, typename B, typename Y1, typename Y,
          typename C, typename H = StepResultOf<F, B1>>
Step<typename H::up_address_type, typename H::up_reply_type, Y1, Y, C> Answer(
    F handler, const Step<B1, B, Y1, Y, C>& p) {
  using In = Step<B1, B, Y1, Y, C>;
  using Out = RebindResult<H, C>;
  static_assert(std::is_same<typename H::down_address_type, Y1>::value &&
                    std::is_same<typename H::down_value_type, Y>::value,
                "the handler must share the stream's downstream interface");
  static_assert(std::is_same<typename H::result_type, B>::value,
                "the handler must finish with the answer the stream awaits");
  using Composer = internal::RequestComposer<In, Out>;
  return Composer::Go(p, std::make_shared<const typename Composer::Handler>(
                             std::move(handler)));
}

//==============================================================================
// STREAMING ALGEBRAS
//==============================================================================

// p >>~ f: `p` starts; each value it emits starts (the first time) or
// resumes (afterwards) the downstream step produced by `handler`.
template <typename UA, typename UR, typename DA, typename DV, typename R,
          typename F, typename H = StepResultOf<F, DV>>
Step<UA, UR, typename H::down_address_type, typename H::down_value_type, R>
PushInto(const Step<UA, UR, DA, DV, R>& p, F handler) {
  using Up = Step<UA, UR, DA, DV, R>;
  static_assert(std::is_same<typename H::up_address_type, DA>::value &&
                    std::is_same<typename H::up_reply_type, DV>::value,
                "the downstream step must await what the upstream emits");
  static_assert(std::is_same<typename H::result_type, R>::value,
                "connected steps must finish with the same result type");
  using Composer = internal::StreamComposer<Up, H>;
  return Composer::Push(
      p, std::make_shared<const typename Composer::DownHandler>(
             std::move(handler)));
}

// f +>> p: `p` starts; its first await starts the upstream step produced by
// `handler`, later awaits resume it.
template <typename F, typename B1, typename B, typename C1, typename C,
          typename R, typename H = StepResultOf<F, B1>>
Step<typename H::up_address_type, typename H::up_reply_type, C1, C, R>
PullFrom(F handler, const Step<B1, B, C1, C, R>& p) {
  using Down = Step<B1, B, C1, C, R>;
  static_assert(std::is_same<typename H::down_address_type, B1>::value &&
                    std::is_same<typename H::down_value_type, B>::value,
                "the upstream step must emit what the downstream awaits");
  static_assert(std::is_same<typename H::result_type, R>::value,
                "connected steps must finish with the same result type");
  using Composer = internal::StreamComposer<H, Down>;
  return Composer::Pull(
      std::make_shared<const typename Composer::UpHandler>(std::move(handler)),
      p);
}

// Connects two stages so that every value `upstream` emits is the answer to
// one await of `downstream`. Whichever side finishes first finishes both.
template <typename A1, typename A, typename B, typename C1, typename C,
          typename R>
Step<A1, A, C1, C, R> Connect(const Step<A1, A, Unit, B, R>& upstream,
                              const Step<Unit, B, C1, C, R>& downstream) {
  return PullFrom([upstream](Unit) { return upstream; }, downstream);
}

// Infix version of Connect. Read | as a shell pipe.
template <typename A1, typename A, typename B, typename C1, typename C,
          typename R>
Step<A1, A, C1, C, R> operator|(const Step<A1, A, Unit, B, R>& upstream,
                                const Step<Unit, B, C1, C, R>& downstream) {
  return Connect(upstream, downstream);
}

// Answers every await of `p` by running `draw` again.
template <typename A1, typename A, typename Y1, typename Y, typename B,
          typename C>
Step<A1, A, Y1, Y, C> Feed(const Step<A1, A, Y1, Y, B>& draw,
                           const Step<Unit, B, Y1, Y, C>& p) {
  return Answer([draw](Unit) { return draw; }, p);
}

//==============================================================================
// IDENTITIES
//==============================================================================

// Identity of PullFrom: forwards the address upstream, the answer
// downstream, and the next address upstream again.
template <typename A1, typename A, typename R>
Step<A1, A, A1, A, R> Pull(A1 address) {
  using S = Step<A1, A, A1, A, R>;
  return S::AwaitUpstream(std::move(address), [](A a) {
    return S::EmitDownstream(std::move(a), [](A1 next) {
      return Pull<A1, A, R>(std::move(next));
    });
  });
}

// Identity of PushInto: the same relay, started by a value.
template <typename A1, typename A, typename R>
Step<A1, A, A1, A, R> Push(A value) {
  using S = Step<A1, A, A1, A, R>;
  return S::EmitDownstream(std::move(value), [](A1 address) {
    return S::AwaitUpstream(std::move(address), [](A next) {
      return Push<A1, A, R>(std::move(next));
    });
  });
}

// Identity of Connect: passes every value through unchanged.
template <typename A, typename R = Unit>
Transformer<A, A, R> Cat() {
  return Pull<Unit, A, R>(Unit());
}

//==============================================================================
// KLEISLI FORMS
//==============================================================================

// (f />/ g)(a) === f(a) //> g
template <typename T, typename X1, typename X, typename B1, typename B,
          typename C1, typename C, typename A1>
Fn<T, Step<X1, X, C1, C, A1>> ComposeFor(Fn<T, Step<X1, X, B1, B, A1>> f,
                                         Fn<B, Step<X1, X, C1, C, B1>> g) {
  return [f, g](T t) { return For(f(std::move(t)), g); };
}

// (f \>\ g)(c1) === f >\\ g(c1)
template <typename B1, typename A1, typename A, typename Y1, typename Y,
          typename B, typename T, typename C>
Fn<T, Step<A1, A, Y1, Y, C>> ComposeAnswer(Fn<B1, Step<A1, A, Y1, Y, B>> f,
                                           Fn<T, Step<B1, B, Y1, Y, C>> g) {
  return [f, g](T t) { return Answer(f, g(std::move(t))); };
}

// (f >~> g)(t) === f(t) >>~ g
template <typename T, typename A1, typename A, typename B1, typename B,
          typename C1, typename C, typename R>
Fn<T, Step<A1, A, C1, C, R>> ComposePush(Fn<T, Step<A1, A, B1, B, R>> f,
                                         Fn<B, Step<B1, B, C1, C, R>> g) {
  return [f, g](T t) { return PushInto(f(std::move(t)), g); };
}

// (f >+> g)(t) === f +>> g(t)
template <typename B1, typename A1, typename A, typename B, typename T,
          typename C1, typename C, typename R>
Fn<T, Step<A1, A, C1, C, R>> ComposePull(Fn<B1, Step<A1, A, B1, B, R>> f,
                                         Fn<T, Step<B1, B, C1, C, R>> g) {
  return [f, g](T t) { return PullFrom(f, g(std::move(t))); };
}

//==============================================================================
// RUNNING
//==============================================================================

// Runs a closed pipeline to completion and returns its result.
template <typename R>
R RunEffect(Closed<R> p) {
  while (true) {
    switch (p.kind()) {
      case Closed<R>::Kind::kAwaitUpstream:
        return Absurd<R>(p.address());
      case Closed<R>::Kind::kEmitDownstream:
        return Absurd<R>(p.value());
      case Closed<R>::Kind::kEffect:
        p = p.Run();
        break;
      case Closed<R>::Kind::kDone:
        return p.result();
    }
  }
}

// The outcome of advancing a source to its next emission: either the
// source's result, or the emitted value together with the rest of the
// source.
template <typename A, typename R>
struct NextResult {
  static NextResult Finished(R r) {
    NextResult next;
    next.result = std::move(r);
    return next;
  }
  static NextResult Emitted(A a, Source<A, R> rest_of_source) {
    NextResult next;
    next.value = std::move(a);
    next.rest = std::move(rest_of_source);
    return next;
  }

  bool done() const { return result.has_value(); }

  absl::optional<R> result;
  absl::optional<A> value;
  absl::optional<Source<A, R>> rest;
};

// Runs the effects of `p` up to its first emission or its end.
template <typename A, typename R>
NextResult<A, R> Next(Source<A, R> p) {
  while (true) {
    switch (p.kind()) {
      case Source<A, R>::Kind::kAwaitUpstream:
        return Absurd<NextResult<A, R>>(p.address());
      case Source<A, R>::Kind::kEmitDownstream:
        return NextResult<A, R>::Emitted(p.value(), p.Continue(Unit()));
      case Source<A, R>::Kind::kEffect:
        p = p.Run();
        break;
      case Source<A, R>::Kind::kDone:
        return NextResult<A, R>::Finished(p.result());
    }
  }
}

}  // namespace bistream

#endif  // BISTREAM_COMPOSITION_H_
