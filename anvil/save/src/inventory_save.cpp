#include <anvil/save/inventory_save.hpp>
#include <anvil/core/filesystem.hpp>
#include <anvil/core/log.hpp>
#include <cstring>
#include <limits>
#include <set>
#include <utility>

namespace anvil::save {

using json = nlohmann::json;

namespace {

void write_u32(std::vector<uint8_t>& out, uint32_t value) {
    uint8_t bytes[sizeof(uint32_t)];
    std::memcpy(bytes, &value, sizeof(value));
    out.insert(out.end(), bytes, bytes + sizeof(bytes));
}

uint32_t read_u32(const uint8_t* data) {
    uint32_t value = 0;
    std::memcpy(&value, data, sizeof(value));
    return value;
}

bool fail(std::string* out_error, const std::string& message) {
    if (out_error) *out_error = message;
    return false;
}

// False when the key is absent, not an integer, or outside the range of int
bool read_int(const json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return false;
    }

    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(value);
        return true;
    }

    int64_t value = it->get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(value);
    return true;
}

bool read_stack(const json& j, inventory::InventoryStack& stack, std::string* out_error) {
    if (!j.is_object()) return fail(out_error, "stack is not an object");

    int quality = 0;
    if (!read_int(j, "recipe_id", stack.recipe_id)) return fail(out_error, "stack has a missing or out-of-range recipe_id");
    if (!read_int(j, "quantity", stack.quantity)) return fail(out_error, "stack has a missing or out-of-range quantity");
    if (!read_int(j, "quality", quality)) return fail(out_error, "stack has a missing or out-of-range quality");
    if (quality < 0 || quality > 255) return fail(out_error, "stack quality out of range");

    stack.quality = static_cast<inventory::ItemQuality>(quality);
    stack.date_added = j.value("date_added", uint64_t{0});
    return true;
}

bool read_entry(const json& j, inventory::RecipeBookEntry& entry, std::string* out_error) {
    if (!j.is_object()) return fail(out_error, "recipe book entry is not an object");
    if (!read_int(j, "recipe_id", entry.recipe_id)) return fail(out_error, "entry has a missing or out-of-range recipe_id");

    entry.times_completed = 0;
    if (j.contains("times_completed") && !read_int(j, "times_completed", entry.times_completed)) {
        return fail(out_error, "entry has an out-of-range times_completed");
    }
    entry.date_unlocked = j.value("date_unlocked", uint64_t{0});
    entry.favorite = j.value("favorite", false);
    return true;
}

} // namespace

// ============================================================================
// Snapshot
// ============================================================================

InventorySnapshot capture(const inventory::InventoryLedger& ledger, const inventory::RecipeBook& book) {
    InventorySnapshot snapshot;
    for (const auto* stack : ledger.get_bag_contents()) {
        snapshot.stacks.push_back(*stack);
    }
    for (const auto* entry : book.get_entries()) {
        snapshot.recipe_book.push_back(*entry);
    }
    snapshot.gold = ledger.get_gold();
    return snapshot;
}

json to_json(const InventorySnapshot& snapshot) {
    json j;
    j["gold"] = snapshot.gold;

    j["stacks"] = json::array();
    for (const auto& stack : snapshot.stacks) {
        j["stacks"].push_back({
            {"recipe_id", stack.recipe_id},
            {"quantity", stack.quantity},
            {"quality", static_cast<int>(stack.quality)},
            {"date_added", stack.date_added}
        });
    }

    j["recipe_book"] = json::array();
    for (const auto& entry : snapshot.recipe_book) {
        j["recipe_book"].push_back({
            {"recipe_id", entry.recipe_id},
            {"date_unlocked", entry.date_unlocked},
            {"times_completed", entry.times_completed},
            {"favorite", entry.favorite}
        });
    }

    return j;
}

std::optional<InventorySnapshot> from_json(const json& j, std::string* out_error) {
    if (!j.is_object()) {
        fail(out_error, "payload is not an object");
        return std::nullopt;
    }

    InventorySnapshot snapshot;

    if (j.contains("gold")) {
        if (!j["gold"].is_number_integer()) {
            fail(out_error, "gold must be an integer");
            return std::nullopt;
        }
        snapshot.gold = j["gold"].get<int64_t>();
    }

    if (j.contains("stacks")) {
        if (!j["stacks"].is_array()) {
            fail(out_error, "stacks must be an array");
            return std::nullopt;
        }
        for (const auto& item : j["stacks"]) {
            inventory::InventoryStack stack;
            if (!read_stack(item, stack, out_error)) return std::nullopt;
            snapshot.stacks.push_back(stack);
        }
    }

    if (j.contains("recipe_book")) {
        if (!j["recipe_book"].is_array()) {
            fail(out_error, "recipe_book must be an array");
            return std::nullopt;
        }
        for (const auto& item : j["recipe_book"]) {
            inventory::RecipeBookEntry entry;
            if (!read_entry(item, entry, out_error)) return std::nullopt;
            snapshot.recipe_book.push_back(entry);
        }
    }

    return snapshot;
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> serialize(const InventorySnapshot& snapshot) {
    std::string payload = to_json(snapshot).dump();

    SaveHeader header;
    header.payload_size = static_cast<uint32_t>(payload.size());
    header.checksum = calculate_checksum(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());

    std::vector<uint8_t> blob;
    blob.reserve(SAVE_HEADER_SIZE + payload.size());
    write_u32(blob, header.magic);
    write_u32(blob, header.version);
    write_u32(blob, header.payload_size);
    write_u32(blob, header.checksum);
    blob.insert(blob.end(), payload.begin(), payload.end());
    return blob;
}

std::optional<InventorySnapshot> deserialize(const std::vector<uint8_t>& blob) {
    if (blob.size() < SAVE_HEADER_SIZE) {
        core::log(core::LogLevel::Warn, "[Save] Save data truncated ({} bytes)", blob.size());
        return std::nullopt;
    }

    SaveHeader header;
    header.magic = read_u32(blob.data());
    header.version = read_u32(blob.data() + 4);
    header.payload_size = read_u32(blob.data() + 8);
    header.checksum = read_u32(blob.data() + 12);

    if (header.magic != SAVE_MAGIC) {
        core::log(core::LogLevel::Warn, "[Save] Not an inventory save (bad magic)");
        return std::nullopt;
    }
    if (header.version > SAVE_VERSION) {
        core::log(core::LogLevel::Warn, "[Save] Save version {} is newer than supported {}",
                  header.version, SAVE_VERSION);
        return std::nullopt;
    }
    if (header.payload_size > MAX_PAYLOAD_SIZE ||
        blob.size() - SAVE_HEADER_SIZE != header.payload_size) {
        core::log(core::LogLevel::Warn, "[Save] Payload size mismatch: header says {}, found {}",
                  header.payload_size, blob.size() - SAVE_HEADER_SIZE);
        return std::nullopt;
    }

    const uint8_t* payload = blob.data() + SAVE_HEADER_SIZE;
    if (calculate_checksum(payload, header.payload_size) != header.checksum) {
        core::log(core::LogLevel::Warn, "[Save] Checksum mismatch");
        return std::nullopt;
    }

    json j = json::parse(payload, payload + header.payload_size, nullptr, false);
    if (j.is_discarded()) {
        core::log(core::LogLevel::Warn, "[Save] Payload is not valid JSON");
        return std::nullopt;
    }

    std::string error;
    std::optional<InventorySnapshot> snapshot;
    try {
        snapshot = from_json(j, &error);
    } catch (const json::exception& e) {
        error = e.what();
    }
    if (!snapshot) {
        core::log(core::LogLevel::Warn, "[Save] Malformed payload: {}", error);
    }
    return snapshot;
}

uint32_t calculate_checksum(const uint8_t* data, size_t size) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < size; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 1) {
                crc = (crc >> 1) ^ 0xEDB88320;
            } else {
                crc >>= 1;
            }
        }
    }
    return ~crc;
}

// ============================================================================
// Validation and loading
// ============================================================================

data::ValidationReport validate(const InventorySnapshot& snapshot, const crafting::RecipeCatalog& catalog) {
    data::ValidationReport report;

    if (snapshot.gold < 0) {
        report.add("Negative gold: " + std::to_string(snapshot.gold));
    }

    std::set<std::pair<int, int>> seen_stacks;
    for (size_t i = 0; i < snapshot.stacks.size(); ++i) {
        const auto& stack = snapshot.stacks[i];
        std::string label = "Stack #" + std::to_string(i + 1);
        int quality = static_cast<int>(stack.quality);

        if (!catalog.exists(stack.recipe_id)) {
            report.add(label + " references unknown recipe " + std::to_string(stack.recipe_id));
        }
        if (stack.quantity <= 0) {
            report.add(label + " has invalid quantity " + std::to_string(stack.quantity));
        }
        if (!inventory::quality_from_int(quality)) {
            report.add(label + " has invalid quality " + std::to_string(quality));
        }
        if (!seen_stacks.insert({stack.recipe_id, quality}).second) {
            report.add(label + " duplicates recipe " + std::to_string(stack.recipe_id) +
                       " at quality " + std::to_string(quality));
        }
    }

    std::set<int> seen_entries;
    for (const auto& entry : snapshot.recipe_book) {
        std::string label = "Recipe book entry " + std::to_string(entry.recipe_id);

        if (!catalog.exists(entry.recipe_id)) {
            report.add(label + " references unknown recipe");
        }
        if (entry.times_completed < 0) {
            report.add(label + " has negative completion count");
        }
        if (!seen_entries.insert(entry.recipe_id).second) {
            report.add("Duplicate recipe book entry " + std::to_string(entry.recipe_id));
        }
    }

    return report;
}

void apply(const InventorySnapshot& snapshot, inventory::InventoryLedger& ledger, inventory::RecipeBook& book) {
    ledger.restore(snapshot.stacks, snapshot.gold);
    book.restore(snapshot.recipe_book);
}

bool load_into(const std::vector<uint8_t>& blob,
               inventory::InventoryLedger& ledger,
               inventory::RecipeBook& book,
               const crafting::RecipeCatalog& catalog) {
    auto snapshot = deserialize(blob);
    if (snapshot) {
        auto report = validate(*snapshot, catalog);
        if (report.ok()) {
            apply(*snapshot, ledger, book);
            core::log(core::LogLevel::Info, "[Save] Loaded {} stacks, {} recipe book entries, {} gold",
                      snapshot->stacks.size(), snapshot->recipe_book.size(), snapshot->gold);
            return true;
        }
        core::log(core::LogLevel::Error, "[Save] Save data failed validation:\n{}", report.to_string());
    } else {
        core::log(core::LogLevel::Error, "[Save] Save data could not be decoded");
    }

    ledger.clear();
    book.clear();
    core::log(core::LogLevel::Warn, "[Save] Starting with an empty inventory");
    return false;
}

// ============================================================================
// File I/O
// ============================================================================

bool save_to_file(const std::string& path, const InventorySnapshot& snapshot) {
    if (!core::FileSystem::write_binary_atomic(path, serialize(snapshot))) {
        core::log(core::LogLevel::Error, "[Save] Failed to write {}", path);
        return false;
    }
    core::log(core::LogLevel::Info, "[Save] Saved inventory to {}", path);
    return true;
}

std::vector<uint8_t> read_save_file(const std::string& path) {
    if (!core::FileSystem::exists(path)) {
        return {};
    }
    return core::FileSystem::read_binary(path);
}

std::optional<InventorySnapshot> load_from_file(const std::string& path) {
    auto blob = read_save_file(path);
    if (blob.empty()) {
        core::log(core::LogLevel::Warn, "[Save] No save data at {}", path);
        return std::nullopt;
    }
    return deserialize(blob);
}

} // namespace anvil::save
