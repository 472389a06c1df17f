#include <gtest/gtest.h>
#include "model/item_generator.h"

#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace auctionsim {
namespace test {

TEST(ItemGenerator, IdsAndNames) {
    ItemGenerator gen(42);
    auto items = gen.generateItems(40);
    ASSERT_EQ(items.size(), 40u);
    for (size_t i = 0; i < items.size(); ++i) {
        const Item& it = items[i];
        EXPECT_EQ(it.id, i + 1);
        EXPECT_EQ(it.name, it.brand + " " + it.category + " " + std::to_string(it.id));
    }
}

TEST(ItemGenerator, AttributeRanges) {
    ItemGenerator gen(1);
    for (uint32_t id = 1; id <= 500; ++id) {
        const Item it = gen.generateItem(id);
        EXPECT_GE(it.base_price, 10.0);
        EXPECT_LE(it.base_price, 5000.0);
        EXPECT_GE(it.weight_kg, 0.1);
        EXPECT_LE(it.weight_kg, 50.0);
        EXPECT_GE(it.year_made, 2010);
        EXPECT_LE(it.year_made, 2024);
        EXPECT_GE(it.warranty_months, 0);
        EXPECT_LE(it.warranty_months, 36);
        EXPECT_GE(it.ship_weight_kg, 0.2);
        EXPECT_LE(it.ship_weight_kg, 55.0);
        EXPECT_GE(it.rating, 3.0);
        EXPECT_LE(it.rating, 10.0);
        EXPECT_FALSE(it.category.empty());
        EXPECT_FALSE(it.condition.empty());
        EXPECT_FALSE(it.certification.empty());
        EXPECT_EQ(std::count(it.dimensions.begin(), it.dimensions.end(), 'x'), 2);
    }
}

TEST(ItemGenerator, SameSeedSameItems) {
    ItemGenerator a(99), b(99);
    auto xs = a.generateItems(10);
    auto ys = b.generateItems(10);
    for (size_t i = 0; i < xs.size(); ++i) {
        EXPECT_EQ(xs[i].name, ys[i].name);
        EXPECT_EQ(xs[i].base_price, ys[i].base_price);
        EXPECT_EQ(xs[i].dimensions, ys[i].dimensions);
    }
}

TEST(ItemGenerator, ConcurrentCallersGetDistinctValidItems) {
    ItemGenerator gen(7);
    std::vector<std::vector<Item>> out(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < out.size(); ++t) {
        threads.emplace_back([&gen, &out, t]() {
            for (uint32_t i = 0; i < 100; ++i)
                out[t].push_back(gen.generateItem(static_cast<uint32_t>(t * 100 + i + 1)));
        });
    }
    for (auto& th : threads)
        th.join();

    std::set<uint32_t> ids;
    for (const auto& v : out) {
        for (const auto& it : v) {
            ids.insert(it.id);
            EXPECT_GE(it.base_price, 10.0);
        }
    }
    EXPECT_EQ(ids.size(), 400u);
}

}  // namespace test
}  // namespace auctionsim
