/**
 * @file test_function.cpp
 * @brief Unit tests for brainrt::Function
 */

#include "brainrt/kernel.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace brainrt;

namespace
{
   // Captures larger than any inline buffer used below
   struct Payload
   {
      std::array<int, 32> values{};
   };

   struct LifetimeCounter
   {
      static inline int alive = 0;

      LifetimeCounter() { ++alive; }
      LifetimeCounter(LifetimeCounter const&) { ++alive; }
      LifetimeCounter(LifetimeCounter&&) noexcept { ++alive; }
      ~LifetimeCounter() { --alive; }

      void operator()() const {}
   };
}

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class FunctionTest : public ::testing::Test
{
protected:
   void SetUp() override
   {
      LifetimeCounter::alive = 0;
   }
};

/* ============================================================================
 * Construction and Invocation
 * ========================================================================= */

TEST_F(FunctionTest, DefaultAndNullAreEmpty)
{
   Function<void()> a;
   Function<void()> b(nullptr);

   EXPECT_FALSE(a);
   EXPECT_FALSE(b);
}

TEST_F(FunctionTest, InvokesLambdaWithCaptures)
{
   int x = 10;
   int result = 0;

   Function<void(), 32> f([x, &result]() { result = x * 2; });

   ASSERT_TRUE(f);
   f();
   EXPECT_EQ(result, 20);
}

TEST_F(FunctionTest, ForwardsArgumentsAndReturnsValue)
{
   Function<double(int, double, float)> f([](int a, double b, float c) { return a + b + c; });

   EXPECT_DOUBLE_EQ(f(1, 2.5, 3.5f), 7.0);
}

TEST_F(FunctionTest, MutableCallableKeepsState)
{
   Function<int()> counter([n = 0]() mutable { return ++n; });

   EXPECT_EQ(counter(), 1);
   EXPECT_EQ(counter(), 2);
   EXPECT_EQ(counter(), 3);
}

TEST_F(FunctionTest, ReturnsOwningValue)
{
   Function<std::string(), 32, HeapPolicy::CanUseHeap> init([] { return std::string("initial"); });

   EXPECT_EQ(init(), "initial");
}

/* ============================================================================
 * Ownership
 * ========================================================================= */

TEST_F(FunctionTest, MoveOnlyCapture)
{
   auto value = std::make_unique<int>(7);

   Function<int(), 32> f([value = std::move(value)]() { return *value; });

   EXPECT_EQ(f(), 7);
}

TEST_F(FunctionTest, MoveConstructionEmptiesSource)
{
   int calls = 0;

   Function<void()> f1([&calls]() { calls++; });
   Function<void()> f2(std::move(f1));

   EXPECT_FALSE(f1);
   ASSERT_TRUE(f2);

   f2();
   EXPECT_EQ(calls, 1);
}

TEST_F(FunctionTest, MoveAssignmentDestroysPreviousTarget)
{
   {
      Function<void()> f1(LifetimeCounter{});
      Function<void()> f2(LifetimeCounter{});
      EXPECT_EQ(LifetimeCounter::alive, 2);

      f2 = std::move(f1);
      EXPECT_EQ(LifetimeCounter::alive, 1);
      EXPECT_FALSE(f1);
   }
   EXPECT_EQ(LifetimeCounter::alive, 0);
}

TEST_F(FunctionTest, EmplaceReplacesTarget)
{
   int first = 0;
   int second = 0;

   Function<void()> f([&first]() { first = 1; });
   f();

   f.emplace([&second]() { second = 2; });
   f();

   EXPECT_EQ(first, 1);
   EXPECT_EQ(second, 2);
}

TEST_F(FunctionTest, ResetIsIdempotent)
{
   Function<void()> f(LifetimeCounter{});
   EXPECT_EQ(LifetimeCounter::alive, 1);

   f.reset();
   EXPECT_FALSE(f);
   EXPECT_EQ(LifetimeCounter::alive, 0);

   f.reset();
   EXPECT_FALSE(f);
}

TEST_F(FunctionTest, SelfMoveAssignmentKeepsTarget)
{
   int calls = 0;
   Function<void()> f([&calls]() { calls++; });

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wself-move"
   f = std::move(f);
#pragma GCC diagnostic pop

   ASSERT_TRUE(f);
   f();
   EXPECT_EQ(calls, 1);
}

/* ============================================================================
 * Heap Policy
 * ========================================================================= */

TEST_F(FunctionTest, CanUseHeapStoresLargeCallable)
{
   Payload payload;
   payload.values[31] = 99;

   Function<int(), 16, HeapPolicy::CanUseHeap> f([payload]() { return payload.values[31]; });

   EXPECT_EQ(f(), 99);
}

TEST_F(FunctionTest, HeapTargetSurvivesMoves)
{
   Payload payload;
   payload.values[0] = 5;

   Function<int(), 16, HeapPolicy::CanUseHeap> a([payload]() { return payload.values[0]; });
   Function<int(), 16, HeapPolicy::CanUseHeap> b(std::move(a));
   Function<int(), 16, HeapPolicy::CanUseHeap> c;
   c = std::move(b);

   EXPECT_FALSE(a);
   EXPECT_FALSE(b);
   EXPECT_EQ(c(), 5);
}

TEST_F(FunctionTest, MustUseHeapReleasesTarget)
{
   {
      Function<void(), 64, HeapPolicy::MustUseHeap> f(LifetimeCounter{});
      EXPECT_EQ(LifetimeCounter::alive, 1);

      auto g = std::move(f);
      EXPECT_EQ(LifetimeCounter::alive, 1);  // pointer handed over, no copy
   }
   EXPECT_EQ(LifetimeCounter::alive, 0);
}

TEST_F(FunctionTest, InlineTargetIsRelocatedOnMove)
{
   {
      Function<void(), 32, HeapPolicy::NoHeap> f(LifetimeCounter{});
      auto g = std::move(f);
      EXPECT_EQ(LifetimeCounter::alive, 1);  // moved-from source destroyed
      EXPECT_TRUE(g);
   }
   EXPECT_EQ(LifetimeCounter::alive, 0);
}

// Does not compile, as intended:
//    Payload payload;
//    Function<void(), 8, HeapPolicy::NoHeap> f([payload]() {});
