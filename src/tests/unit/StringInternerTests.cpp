//===----------------------------------------------------------------------===//
//
// Part of the Strand project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/StringInternerTests.cpp
// Purpose: Verify selector interning is stable, bounded and thread-safe.
// Key invariants: Interning the same text yields the same symbol.
// Ownership/Lifetime: Standalone executable.
// Links: src/support/string_interner.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/string_interner.hpp"

#include <string>
#include <thread>
#include <vector>

using strand::support::StringInterner;
using strand::support::Symbol;

TEST(StringInterner, SameTextSameSymbol)
{
    StringInterner in;
    Symbol a = in.intern("value:");
    Symbol b = in.intern("value:");
    Symbol c = in.intern("at:put:");
    EXPECT_TRUE(a);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(in.lookup(a), "value:");
    EXPECT_EQ(in.lookup(c), "at:put:");
    EXPECT_EQ(in.size(), 2u);
}

TEST(StringInterner, LookupOfUnknownSymbolIsEmpty)
{
    StringInterner in;
    EXPECT_TRUE(in.lookup(Symbol{}).empty());
    EXPECT_TRUE(in.lookup(Symbol{42}).empty());
}

TEST(StringInterner, OverflowYieldsInvalidSymbol)
{
    StringInterner in(2);
    EXPECT_TRUE(in.intern("a"));
    EXPECT_TRUE(in.intern("b"));
    EXPECT_FALSE(in.intern("c"));
    EXPECT_TRUE(in.intern("a"));
}

TEST(StringInterner, ConcurrentInterningAgrees)
{
    StringInterner in;
    std::vector<std::vector<Symbol>> seen(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < seen.size(); ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                for (int i = 0; i < 100; ++i)
                    seen[t].push_back(in.intern("sel" + std::to_string(i)));
            });
    }
    for (auto &th : threads)
        th.join();

    EXPECT_EQ(in.size(), 100u);
    for (size_t t = 1; t < seen.size(); ++t)
        EXPECT_EQ(seen[t], seen[0]);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
