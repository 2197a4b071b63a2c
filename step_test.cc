// Tests for the step representation and sequencing.

#include "step.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "composition.h"
#include "gtest/gtest.h"
#include "transformers.h"
#include "traversal.h"

namespace bistream {
namespace {

using std::vector;
using P = SourcePorts<int>;

TEST(StepTest, PrimitivesBuildTheMatchingVariant) {
  using T = TransformerPorts<int, std::string>;

  Transformer<int, std::string, int> await = T::Await();
  ASSERT_EQ(await.kind(),
            (Transformer<int, std::string, int>::Kind::kAwaitUpstream));
  Transformer<int, std::string, int> answered = await.Receive(42);
  ASSERT_EQ(answered.kind(),
            (Transformer<int, std::string, int>::Kind::kDone));
  EXPECT_EQ(answered.result(), 42);

  Transformer<int, std::string, Unit> emit = T::Emit("x");
  ASSERT_EQ(emit.kind(),
            (Transformer<int, std::string, Unit>::Kind::kEmitDownstream));
  EXPECT_EQ(emit.value(), "x");
  EXPECT_EQ(emit.Continue(Unit()).kind(),
            (Transformer<int, std::string, Unit>::Kind::kDone));
}

TEST(StepTest, LiftRunsItsActionOnlyWhenTraversed) {
  int runs = 0;
  Closed<int> lifted = ClosedPorts::Lift([&runs] { return ++runs; });
  EXPECT_EQ(runs, 0);
  ASSERT_EQ(lifted.kind(), Closed<int>::Kind::kEffect);
  EXPECT_EQ(RunEffect(lifted), 1);
  // Every traversal performs the action again.
  EXPECT_EQ(RunEffect(lifted), 2);
}

TEST(StepTest, BindSequencesEffectsAndEmissions) {
  vector<std::string> log;
  Source<int, std::string> p =
      Bind(P::Perform([&log] { log.push_back("start"); }), [&log](Unit) {
        return Bind(P::Emit(1), [&log](Unit) {
          return Bind(P::Lift([&log] {
                        log.push_back("lift");
                        return 2;
                      }),
                      [](int two) {
                        return Then(P::Emit(two),
                                    P::Return(std::string("end")));
                      });
        });
      });
  std::pair<vector<int>, std::string> out = ToListWithResult(p);
  EXPECT_EQ(out.first, (vector<int>{1, 2}));
  EXPECT_EQ(out.second, "end");
  EXPECT_EQ(log, (vector<std::string>{"start", "lift"}));
}

TEST(StepTest, BindMustObeyMonadLaws) {
  Fn<int, Source<int, int>> f = [](int x) {
    return Then(P::Emit(x), P::Return(x + 1));
  };
  Fn<int, Source<int, int>> g = [](int x) {
    return Then(Then(P::Emit(10 * x), P::Emit(x)), P::Return(x * 2));
  };
  Fn<int, Source<int, int>> ret = [](int x) { return P::Return(x); };
  vector<Source<int, int>> ms = {
      P::Return(3),
      Then(P::Emit(7), P::Return(3)),
      Then(Then(P::Emit(1), P::Emit(2)), P::Return(5)),
  };

  // Left identity.
  EXPECT_EQ(ToListWithResult(Bind(P::Return(4), f)), ToListWithResult(f(4)));
  for (const auto& m : ms) {
    // Right identity.
    EXPECT_EQ(ToListWithResult(Bind(m, ret)), ToListWithResult(m));
    // Associativity.
    EXPECT_EQ(
        ToListWithResult(Bind(Bind(m, f), g)),
        ToListWithResult(Bind(m, [f, g](int x) { return Bind(f(x), g); })));
  }
}

TEST(StepTest, MapResultAppliesOnlyToTheResult) {
  Source<int, int> p = Then(P::Emit(1), P::Return(20));
  Source<int, std::string> mapped =
      MapResult(p, [](int r) { return std::to_string(r + 1); });
  EXPECT_EQ(ToListWithResult(mapped),
            std::make_pair(vector<int>{1}, std::string("21")));
}

Closed<int> CountDown(int n, std::shared_ptr<int> ticks) {
  if (n == 0) {
    return ClosedPorts::Lift([ticks] { return *ticks; });
  }
  return Bind(ClosedPorts::Perform([ticks] { ++*ticks; }),
              [n, ticks](Unit) { return CountDown(n - 1, ticks); });
}

Closed<int> PureCountDown(int n) {
  if (n == 0) {
    return ClosedPorts::Return(0);
  }
  return Bind(ClosedPorts::Return(n),
              [](int m) { return PureCountDown(m - 1); });
}

TEST(StepTest, LongBindChainsDoNotGrowTheStack) {
  EXPECT_EQ(RunEffect(CountDown(1000000, std::make_shared<int>(0))), 1000000);
  EXPECT_EQ(RunEffect(PureCountDown(1000000)), 0);
}

TEST(StepTest, LeftNestedChainsDoNotGrowTheStack) {
  Source<int, Unit> ones = P::Return();
  for (int i = 0; i < 1000000; ++i) {
    ones = Then(ones, P::Emit(1));
  }
  EXPECT_EQ(Sum(ones), 1000000);
  // The same step can be traversed again.
  EXPECT_EQ(Length(ones), 1000000u);

  Closed<int> counted = ClosedPorts::Return(0);
  for (int i = 0; i < 1000000; ++i) {
    counted = Bind(counted, [](int n) { return ClosedPorts::Return(n + 1); });
  }
  EXPECT_EQ(RunEffect(counted), 1000000);
}

TEST(StepTest, LeftNestedChainsKeepTheirOrder) {
  Source<int, int> p = P::Return(0);
  for (int i = 1; i <= 4; ++i) {
    p = Bind(p, [i](int last) {
      return Then(P::Emit(10 * i + last), P::Return(i));
    });
  }
  std::pair<vector<int>, int> out = ToListWithResult(p);
  EXPECT_EQ(out.first, (vector<int>{10, 21, 32, 43}));
  EXPECT_EQ(out.second, 4);
}

TEST(StepDeathTest, AccessingTheWrongVariantIsFatal) {
  Source<int, int> done = P::Return(3);
  EXPECT_DEATH(done.value(), "wrong variant");
  EXPECT_DEATH(P::Emit(1).result(), "wrong variant");
}

TEST(StepTest, LongStreamsDoNotGrowTheStack) {
  std::shared_ptr<int> next = std::make_shared<int>(0);
  Source<int, Unit> counting = RepeatM<int>([next] { return (*next)++; }) |
                               Take<int>(1000000);
  EXPECT_EQ(Length(counting), 1000000u);
  EXPECT_EQ(*next, 1000000);
}

}  // namespace
}  // namespace bistream

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
