#pragma once

#include <anvil/inventory/inventory_ledger.hpp>
#include <anvil/inventory/recipe_book.hpp>
#include <anvil/crafting/recipe_catalog.hpp>
#include <anvil/data/validation.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace anvil::save {

// Save file version for compatibility checking
constexpr uint32_t SAVE_VERSION = 1;
constexpr uint32_t SAVE_MAGIC = 0x4C564E41;  // "ANVL"
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

// Fixed-size header in front of the JSON payload
struct SaveHeader {
    uint32_t magic = SAVE_MAGIC;
    uint32_t version = SAVE_VERSION;
    uint32_t payload_size = 0;
    uint32_t checksum = 0;      // CRC32 of the payload
};

constexpr size_t SAVE_HEADER_SIZE = 4 * sizeof(uint32_t);

// ============================================================================
// InventorySnapshot - Persistent part of the ledger and recipe book
// ============================================================================

struct InventorySnapshot {
    std::vector<inventory::InventoryStack> stacks;          // Bag display order
    std::vector<inventory::RecipeBookEntry> recipe_book;    // Unlock order
    int64_t gold = 0;
};

InventorySnapshot capture(const inventory::InventoryLedger& ledger, const inventory::RecipeBook& book);

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> serialize(const InventorySnapshot& snapshot);

// nullopt on bad magic, newer version, truncation, checksum mismatch or malformed payload
std::optional<InventorySnapshot> deserialize(const std::vector<uint8_t>& blob);

nlohmann::json to_json(const InventorySnapshot& snapshot);
std::optional<InventorySnapshot> from_json(const nlohmann::json& j, std::string* out_error = nullptr);

uint32_t calculate_checksum(const uint8_t* data, size_t size);

// ============================================================================
// Validation and loading
// ============================================================================

// Reports every problem: unknown recipes, non-positive quantities, duplicate
// stacks or entries, negative counters or gold, out-of-range quality
data::ValidationReport validate(const InventorySnapshot& snapshot, const crafting::RecipeCatalog& catalog);

// Installs the snapshot only if it decodes and validates. Otherwise the ledger
// and book are reset to empty and false is returned.
bool load_into(const std::vector<uint8_t>& blob,
               inventory::InventoryLedger& ledger,
               inventory::RecipeBook& book,
               const crafting::RecipeCatalog& catalog);

void apply(const InventorySnapshot& snapshot, inventory::InventoryLedger& ledger, inventory::RecipeBook& book);

// ============================================================================
// File I/O
// ============================================================================

// Written to a temp file and renamed over the target
bool save_to_file(const std::string& path, const InventorySnapshot& snapshot);

// Raw blob; empty if the file is missing or unreadable
std::vector<uint8_t> read_save_file(const std::string& path);

std::optional<InventorySnapshot> load_from_file(const std::string& path);

} // namespace anvil::save
