#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

#include "perf_symbol_map.hpp"

TEST(SplitSymbol, ManagedSignature) {
    SymbolParts parts = split_symbol("Game.Systems.Physics:Step (single,int)");
    EXPECT_EQ(parts.class_name, "Game.Systems.Physics");
    EXPECT_EQ(parts.method_name, "Step");
    EXPECT_EQ(parts.descriptor, "(single,int)");
}

TEST(SplitSymbol, DemangledCpp) {
    SymbolParts parts = split_symbol("engine::World::tick(double) const");
    EXPECT_EQ(parts.class_name, "engine::World");
    EXPECT_EQ(parts.method_name, "tick");
    EXPECT_EQ(parts.descriptor, "(double)");
}

TEST(SplitSymbol, BareName) {
    SymbolParts parts = split_symbol("epoll_wait");
    EXPECT_EQ(parts.class_name, "");
    EXPECT_EQ(parts.method_name, "epoll_wait");
    EXPECT_EQ(parts.descriptor, "");
}

TEST(PerfSymbolMap, ReadsAppendedLines) {
    std::string path = testing::TempDir() + "perf_symbol_map_ut.map";
    {
        std::ofstream out(path, std::ios::trunc);
        out << "1000 100 App:first ()\n";
        out << "2000 50 App:second (int)\n";
        out << "3000 10 App:partial";
    }

    StringPool pool;
    PerfSymbolMap map(pool, path);
    map.maybe_append();

    EXPECT_EQ(map.symbols.size(), 2u);
    auto first = map.resolve(0x1000 + 0x20);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(pool.get_by_id(first->name_id), "App:first ()");
    EXPECT_FALSE(map.resolve(0x1000 + 0x100).has_value());
    EXPECT_FALSE(map.resolve(0x10).has_value());
    EXPECT_FALSE(map.resolve(0x3000).has_value());

    {
        std::ofstream out(path, std::ios::app);
        out << " ()\n";
    }
    map.maybe_append();
    auto partial = map.resolve(0x3005);
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(pool.get_by_id(partial->name_id), "App:partial ()");

    std::remove(path.c_str());
}

TEST(PerfSymbolMap, MissingFileIsEmpty) {
    StringPool pool;
    PerfSymbolMap map(pool, testing::TempDir() + "no-such-perf.map");
    map.maybe_append();
    EXPECT_TRUE(map.symbols.empty());
    EXPECT_FALSE(map.resolve(0x1000).has_value());
}

TEST(StringPool, InternsOnce) {
    StringPool pool;
    std::string name = "App:run";
    uint64_t id = pool.intern(name);
    name = "changed";
    EXPECT_EQ(pool.intern("App:run"), id);
    EXPECT_EQ(pool.get_by_id(id), "App:run");
    EXPECT_EQ(pool.size(), 1u);
}
