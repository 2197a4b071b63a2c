// Suspended, effectful, bidirectional stream steps.  -*- c++ -*-

#ifndef BISTREAM_STEP_H_
#define BISTREAM_STEP_H_

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"

namespace bistream {

//==============================================================================
// Interface marker types
//==============================================================================

// The uninhabited type. Closing an interface means fixing its types to Void,
// so that no value can ever travel through it.
class Void {
 private:
  Void() {}
};

// A value of Void can never exist, so reaching this is a contract violation.
template <typename T>
T Absurd(const Void& /*never*/) {
  ABSL_LOG(FATAL) << "bistream: a value travelled through a closed interface";
}

// The type with exactly one value.
struct Unit {};

inline bool operator==(Unit, Unit) { return true; }
inline bool operator!=(Unit, Unit) { return false; }

// Let's introduce a lightweight notation for function types.
template <typename A, typename B> using Fn = std::function<B(A)>;

//==============================================================================
// CORE MODEL
//==============================================================================

namespace internal {

// The untyped node graph behind every Step with a given interface. Only
// Done nodes know the result type, so a chain of continuations from one
// result type to the next can live in a single queue.
template <typename UpAddr, typename UpReply, typename DownAddr,
          typename DownValue>
struct Core {
  // The first four kinds are, in order, the kinds a Step exposes.
  enum class Kind { kAwaitUpstream, kEmitDownstream, kEffect, kDone, kBind };

  struct Node {
    explicit Node(Kind k) : kind(k) {}
    virtual ~Node() = default;
    const Kind kind;
  };

  using Ptr = std::shared_ptr<const Node>;

  // Continues a finished computation given its Done node.
  using Resume = std::function<Ptr(const Node&)>;

  struct AwaitNode final : Node {
    static constexpr Kind kKind = Kind::kAwaitUpstream;
    AwaitNode(UpAddr a, std::function<Ptr(UpReply)> k)
        : Node(kKind), address(std::move(a)), next(std::move(k)) {}
    UpAddr address;
    std::function<Ptr(UpReply)> next;
  };

  struct EmitNode final : Node {
    static constexpr Kind kKind = Kind::kEmitDownstream;
    EmitNode(DownValue v, std::function<Ptr(DownAddr)> k)
        : Node(kKind), value(std::move(v)), next(std::move(k)) {}
    DownValue value;
    std::function<Ptr(DownAddr)> next;
  };

  struct EffectNode final : Node {
    static constexpr Kind kKind = Kind::kEffect;
    explicit EffectNode(std::function<Ptr()> a)
        : Node(kKind), action(std::move(a)) {}
    std::function<Ptr()> action;
  };

  template <typename R>
  struct DoneNode final : Node {
    static constexpr Kind kKind = Kind::kDone;
    explicit DoneNode(R r) : Node(kKind), result(std::move(r)) {}
    R result;
  };

  // A persistent sequence of continuations: a leaf holds one, an inner cell
  // holds everything on its left followed by everything on its right.
  struct Queue {
    explicit Queue(Resume k) : resume(std::move(k)) {}
    Queue(std::shared_ptr<Queue> l, std::shared_ptr<Queue> r)
        : left(std::move(l)), right(std::move(r)) {}

    // Long queues are torn down iteratively.
    ~Queue() {
      std::vector<std::shared_ptr<Queue>> pending;
      if (left) pending.push_back(std::move(left));
      if (right) pending.push_back(std::move(right));
      while (!pending.empty()) {
        std::shared_ptr<Queue> cell = std::move(pending.back());
        pending.pop_back();
        if (cell.use_count() == 1) {
          if (cell->left) pending.push_back(std::move(cell->left));
          if (cell->right) pending.push_back(std::move(cell->right));
        }
      }
    }

    Resume resume;
    std::shared_ptr<Queue> left;
    std::shared_ptr<Queue> right;
  };

  using QueuePtr = std::shared_ptr<Queue>;

  // `inner` followed by every continuation in `queue`. `inner` is never
  // itself a BindNode.
  struct BindNode final : Node {
    static constexpr Kind kKind = Kind::kBind;
    BindNode(Ptr p, QueuePtr q)
        : Node(kKind), inner(std::move(p)), queue(std::move(q)) {}
    Ptr inner;
    QueuePtr queue;
  };

  static QueuePtr Append(QueuePtr front, QueuePtr back) {
    return std::make_shared<Queue>(std::move(front), std::move(back));
  }

  // Splits a queue into its first leaf and the rest, which is null when the
  // leaf was the only continuation.
  static std::pair<QueuePtr, QueuePtr> PopFront(QueuePtr queue) {
    QueuePtr rest;
    while (queue->left) {
      rest = rest ? Append(queue->right, std::move(rest)) : queue->right;
      QueuePtr left = queue->left;
      queue = std::move(left);
    }
    return std::make_pair(std::move(queue), std::move(rest));
  }

  // Appends `queue` to the continuations of `p` in constant time, so that
  // (p >>= k1) >>= k2 is stored as p >>= (k1, k2).
  static Ptr BindTo(Ptr p, QueuePtr queue) {
    if (!queue) {
      return p;
    }
    if (p->kind == Kind::kBind) {
      const BindNode& bound = static_cast<const BindNode&>(*p);
      return std::make_shared<const BindNode>(
          bound.inner, Append(bound.queue, std::move(queue)));
    }
    return std::make_shared<const BindNode>(std::move(p), std::move(queue));
  }

  // Exposes the first node of `p`. Every case does a constant amount of
  // work and defers the rest into a continuation or an Effect thunk, so
  // neither long chains nor deeply left-nested ones grow the call stack.
  static Ptr Expose(Ptr p) {
    if (p->kind != Kind::kBind) {
      return p;
    }
    const BindNode& bound = static_cast<const BindNode&>(*p);
    Ptr inner = bound.inner;
    QueuePtr queue = bound.queue;
    switch (inner->kind) {
      case Kind::kAwaitUpstream:
        return std::make_shared<const AwaitNode>(
            static_cast<const AwaitNode&>(*inner).address,
            [inner, queue](UpReply reply) {
              return BindTo(
                  static_cast<const AwaitNode&>(*inner).next(std::move(reply)),
                  queue);
            });
      case Kind::kEmitDownstream:
        return std::make_shared<const EmitNode>(
            static_cast<const EmitNode&>(*inner).value,
            [inner, queue](DownAddr address) {
              return BindTo(
                  static_cast<const EmitNode&>(*inner).next(std::move(address)),
                  queue);
            });
      case Kind::kEffect:
        return std::make_shared<const EffectNode>([inner, queue] {
          return BindTo(static_cast<const EffectNode&>(*inner).action(),
                        queue);
        });
      case Kind::kDone:
      case Kind::kBind:
        break;
    }
    return std::make_shared<const EffectNode>([inner, queue] {
      std::pair<QueuePtr, QueuePtr> split = PopFront(queue);
      return BindTo(split.first->resume(*inner), std::move(split.second));
    });
  }
};

struct Sequencer;

}  // namespace internal

// A Step is a suspended stream computation. It talks to an upstream
// (sending UpAddr requests and receiving UpReply answers) and to a
// downstream (offering DownValue values and receiving DownAddr
// acknowledgements), and eventually finishes with an R.
//
// Steps are immutable and share structure. A traversal walks a Step one node
// at a time and drops the nodes it has left behind.
template <typename UpAddr, typename UpReply, typename DownAddr,
          typename DownValue, typename R>
class Step {
 public:
  typedef UpAddr up_address_type;
  typedef UpReply up_reply_type;
  typedef DownAddr down_address_type;
  typedef DownValue down_value_type;
  typedef R result_type;

  enum class Kind { kAwaitUpstream, kEmitDownstream, kEffect, kDone };

  using UpstreamContinuation = std::function<Step(UpReply)>;
  using DownstreamContinuation = std::function<Step(DownAddr)>;
  using Action = std::function<Step()>;

  // Suspend, asking upstream to answer `address`.
  static Step AwaitUpstream(UpAddr address, UpstreamContinuation next) {
    return Step(std::make_shared<const AwaitNode>(
        std::move(address),
        [next](UpReply reply) { return next(std::move(reply)).raw_; }));
  }

  // Suspend, offering `value` downstream.
  static Step EmitDownstream(DownValue value, DownstreamContinuation next) {
    return Step(std::make_shared<const EmitNode>(
        std::move(value),
        [next](DownAddr address) { return next(std::move(address)).raw_; }));
  }

  // Perform one unit of work, which yields the next step.
  static Step Effect(Action action) {
    return Step(std::make_shared<const EffectNode>(
        [action] { return action().raw_; }));
  }

  static Step Done(R result) {
    return Step(std::make_shared<const DoneNode>(std::move(result)));
  }

  Kind kind() const { return static_cast<Kind>(view_->kind); }

  const UpAddr& address() const { return As<AwaitNode>().address; }
  const DownValue& value() const { return As<EmitNode>().value; }
  const R& result() const { return As<DoneNode>().result; }

  // Resumes an AwaitUpstream step with upstream's answer.
  Step Receive(UpReply reply) const {
    return Step(As<AwaitNode>().next(std::move(reply)));
  }

  // Resumes an EmitDownstream step with downstream's acknowledgement.
  Step Continue(DownAddr address) const {
    return Step(As<EmitNode>().next(std::move(address)));
  }

  // Performs the work of an Effect step.
  Step Run() const { return Step(As<EffectNode>().action()); }

 private:
  friend struct internal::Sequencer;

  using Core = internal::Core<UpAddr, UpReply, DownAddr, DownValue>;
  using AwaitNode = typename Core::AwaitNode;
  using EmitNode = typename Core::EmitNode;
  using EffectNode = typename Core::EffectNode;
  using DoneNode = typename Core::template DoneNode<R>;

  explicit Step(typename Core::Ptr raw)
      : raw_(std::move(raw)), view_(Core::Expose(raw_)) {}

  template <typename N>
  const N& As() const {
    ABSL_CHECK(view_->kind == N::kKind)
        << "bistream: step accessed as the wrong variant";
    return static_cast<const N&>(*view_);
  }

  // The step as built, possibly a pending bind, and its first node.
  typename Core::Ptr raw_;
  typename Core::Ptr view_;
};

// True when two step types expose the same four interface types.
template <typename S, typename T>
struct SamePorts
    : std::integral_constant<
          bool,
          std::is_same<typename S::up_address_type,
                       typename T::up_address_type>::value &&
          std::is_same<typename S::up_reply_type,
                       typename T::up_reply_type>::value &&
          std::is_same<typename S::down_address_type,
                       typename T::down_address_type>::value &&
          std::is_same<typename S::down_value_type,
                       typename T::down_value_type>::value> {};

// S with its result type replaced by R.
template <typename S, typename R>
using RebindResult =
    Step<typename S::up_address_type, typename S::up_reply_type,
         typename S::down_address_type, typename S::down_value_type, R>;

// The step type produced by calling F with an argument of type Arg.
template <typename F, typename Arg>
using StepResultOf = typename std::decay<decltype(
    std::declval<F&>()(std::declval<Arg>()))>::type;

//==============================================================================
// SEQUENCING
//==============================================================================

namespace internal {

struct Sequencer {
  template <typename From, typename To, typename K>
  static To Bind(const From& p, K k) {
    using Core = typename From::Core;
    using Done = typename Core::template DoneNode<typename From::result_type>;
    Fn<typename From::result_type, To> next(std::move(k));
    typename Core::Resume resume = [next](const typename Core::Node& done) {
      return next(static_cast<const Done&>(done).result).raw_;
    };
    return To(Core::BindTo(
        p.raw_, std::make_shared<typename Core::Queue>(std::move(resume))));
  }
};

}  // namespace internal

// Sequencing: runs `p`, then continues with k(result of p).
template <typename UA, typename UR, typename DA, typename DV, typename R,
          typename K, typename Next = StepResultOf<K, R>>
Next Bind(const Step<UA, UR, DA, DV, R>& p, K k) {
  using From = Step<UA, UR, DA, DV, R>;
  static_assert(SamePorts<From, Next>::value,
                "a continuation must keep the interface of the step before it");
  return internal::Sequencer::Bind<From, Next>(p, std::move(k));
}

// Runs `p`, discards its result, then runs `next`.
template <typename UA, typename UR, typename DA, typename DV, typename R,
          typename R2>
Step<UA, UR, DA, DV, R2> Then(const Step<UA, UR, DA, DV, R>& p,
                              Step<UA, UR, DA, DV, R2> next) {
  return Bind(p, [next](const R& /*discarded*/) { return next; });
}

// Steps are functors over their result.
template <typename UA, typename UR, typename DA, typename DV, typename R,
          typename F, typename R2 = typename std::decay<decltype(
                          std::declval<F&>()(std::declval<R>()))>::type>
Step<UA, UR, DA, DV, R2> MapResult(const Step<UA, UR, DA, DV, R>& p, F f) {
  return Bind(p, [f](R r) {
    return Step<UA, UR, DA, DV, R2>::Done(f(std::move(r)));
  });
}

//==============================================================================
// PRIMITIVE OPERATIONS
//==============================================================================

// The primitive operations for steps with a given interface. Derived
// combinators build their steps from these and from Bind, never from the
// variant constructors directly.
template <typename UpAddr, typename UpReply, typename DownAddr,
          typename DownValue>
struct Ports {
  template <typename R>
  using StepOf = Step<UpAddr, UpReply, DownAddr, DownValue, R>;

  // Ask upstream to answer `address`; finishes with the answer.
  static StepOf<UpReply> Request(UpAddr address) {
    return StepOf<UpReply>::AwaitUpstream(std::move(address), [](UpReply r) {
      return StepOf<UpReply>::Done(std::move(r));
    });
  }

  // Request for interfaces whose upstream address is Unit.
  static StepOf<UpReply> Await() { return Request(UpAddr()); }

  // Offer `value` downstream; finishes with downstream's acknowledgement.
  static StepOf<DownAddr> Emit(DownValue value) {
    return StepOf<DownAddr>::EmitDownstream(
        std::move(value),
        [](DownAddr a) { return StepOf<DownAddr>::Done(std::move(a)); });
  }

  template <typename R>
  static StepOf<R> Return(R result) {
    return StepOf<R>::Done(std::move(result));
  }

  static StepOf<Unit> Return() { return StepOf<Unit>::Done(Unit()); }

  // Runs `action` once, when a traversal reaches this step, and finishes
  // with what it returned.
  template <typename F, typename R = typename std::decay<
                            decltype(std::declval<F&>()())>::type>
  static StepOf<R> Lift(F action) {
    return StepOf<R>::Effect(
        [action]() mutable { return StepOf<R>::Done(action()); });
  }

  // Lift for actions run only for their side effects.
  template <typename F>
  static StepOf<Unit> Perform(F action) {
    return StepOf<Unit>::Effect([action]() mutable {
      action();
      return StepOf<Unit>::Done(Unit());
    });
  }
};

//==============================================================================
// SPECIALIZATIONS
//==============================================================================

// Only emits: can never await.
template <typename B>
using SourcePorts = Ports<Void, Unit, Unit, B>;
template <typename B, typename R>
using Source = Step<Void, Unit, Unit, B, R>;

// Only awaits: can never emit.
template <typename A>
using SinkPorts = Ports<Unit, A, Unit, Void>;
template <typename A, typename R>
using Sink = Step<Unit, A, Unit, Void, R>;

// Awaits As and emits Bs.
template <typename A, typename B>
using TransformerPorts = Ports<Unit, A, Unit, B>;
template <typename A, typename B, typename R>
using Transformer = Step<Unit, A, Unit, B, R>;

// No interface at all: a self-contained effectful computation.
using ClosedPorts = Ports<Void, Unit, Unit, Void>;
template <typename R>
using Closed = Step<Void, Unit, Unit, Void, R>;

}  // namespace bistream

#endif  // BISTREAM_STEP_H_
