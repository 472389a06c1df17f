#include "model/item_generator.h"

#include <array>
#include <cstdio>
#include <string>

namespace auctionsim {

namespace {

constexpr std::array<const char*, 7> kCategories = {
    "Electronics", "Art", "Collectibles", "Jewelry", "Furniture", "Books", "Clothing"};
constexpr std::array<const char*, 7> kBrands = {
    "Apple", "Samsung", "Sony", "Nike", "Canon", "Rolex", "Generic"};
constexpr std::array<const char*, 5> kConditions = {
    "New", "Like New", "Used", "Refurbished", "Fair"};
constexpr std::array<const char*, 7> kColors = {
    "Black", "White", "Silver", "Gold", "Blue", "Red", "Green"};
constexpr std::array<const char*, 6> kSizes = {
    "Small", "Medium", "Large", "XL", "XXL", "One Size"};
constexpr std::array<const char*, 7> kMaterials = {
    "Metal", "Plastic", "Wood", "Leather", "Fabric", "Glass", "Ceramic"};
constexpr std::array<const char*, 5> kRarities = {
    "Common", "Uncommon", "Rare", "Very Rare", "Ultra Rare"};
constexpr std::array<const char*, 7> kOrigins = {
    "USA", "China", "Japan", "Germany", "Italy", "France", "UK"};
constexpr std::array<const char*, 7> kCertifications = {
    "CE", "FCC", "ISO9001", "RoHS", "None", "UL", "Energy Star"};

// Price, weight and rating ranges
constexpr double kMinBasePrice  = 10.0;
constexpr double kMaxBasePrice  = 5000.0;
constexpr double kMinWeightKg   = 0.1;
constexpr double kMaxWeightKg   = 50.0;
constexpr double kMinShipKg     = 0.2;
constexpr double kMaxShipKg     = 55.0;
constexpr double kMinDimCm      = 5.0;
constexpr double kMaxDimCm      = 100.0;
constexpr double kMinRating     = 3.0;
constexpr double kMaxRating     = 10.0;
constexpr int32_t kMinYear      = 2010;
constexpr int32_t kMaxYear      = 2024;
constexpr int32_t kMaxWarrantyM = 36;

template <size_t N>
const char* pick(IRng& rng, const std::array<const char*, N>& choices) {
    return choices[static_cast<size_t>(rng.uniformInt(0, static_cast<int32_t>(N) - 1))];
}

}  // namespace

ItemGenerator::ItemGenerator(uint64_t seed) : rng_(seed) {}

Item ItemGenerator::generateItem(uint32_t id) {
    std::lock_guard<std::mutex> g(mu_);

    Item item{};
    item.id       = id;
    item.category = pick(rng_, kCategories);
    item.brand    = pick(rng_, kBrands);
    item.name     = item.brand + " " + item.category + " " + std::to_string(id);

    item.condition = pick(rng_, kConditions);
    item.color     = pick(rng_, kColors);
    item.size      = pick(rng_, kSizes);
    item.weight_kg = rng_.uniformReal(kMinWeightKg, kMaxWeightKg);
    item.material  = pick(rng_, kMaterials);
    item.year_made = rng_.uniformInt(kMinYear, kMaxYear);

    item.origin      = pick(rng_, kOrigins);
    item.rarity      = pick(rng_, kRarities);
    item.base_price  = rng_.uniformReal(kMinBasePrice, kMaxBasePrice);
    item.description = "High quality " + item.category + " from " + item.brand;
    item.features    = "Premium " + item.category + " with excellent quality";

    item.warranty_months = rng_.uniformInt(0, kMaxWarrantyM);
    item.ship_weight_kg  = rng_.uniformReal(kMinShipKg, kMaxShipKg);

    char dims[64];
    const double l = rng_.uniformReal(kMinDimCm, kMaxDimCm);
    const double w = rng_.uniformReal(kMinDimCm, kMaxDimCm);
    const double h = rng_.uniformReal(kMinDimCm, kMaxDimCm);
    std::snprintf(dims, sizeof(dims), "%.1fx%.1fx%.1f", l, w, h);
    item.dimensions = dims;

    item.certification = pick(rng_, kCertifications);
    item.rating        = rng_.uniformReal(kMinRating, kMaxRating);
    return item;
}

std::vector<Item> ItemGenerator::generateItems(uint32_t count) {
    std::vector<Item> items;
    items.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
        items.push_back(generateItem(i + 1));
    return items;
}

}  // namespace auctionsim
