/**
 * ContentTypes.h
 *
 * Identifier types shared by dialogue and quest content, plus the reference
 * sets a campaign defines outside of its dialogues and quests.
 */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <unordered_set>

namespace Parley {

using DialogueId = uint16_t;
using NodeId = uint16_t;
using QuestId = uint16_t;
using ItemId = uint16_t;
using MonsterId = uint16_t;
using NpcId = uint16_t;
using MapId = uint16_t;
using ShopId = uint16_t;

/**
 * Used as the final branch of an if-constexpr chain inside std::visit so a
 * variant alternative without a handler fails to compile.
 */
template<typename T>
inline constexpr bool kUnhandledAlternative = false;

/**
 * Tile coordinate on a map
 */
using Position = glm::ivec2;

/**
 * Item id with a count, used by give/take actions and item rewards
 */
struct ItemStack {
    ItemId itemId = 0;
    uint16_t quantity = 1;
};

/**
 * Ids defined by the rest of a campaign (monster, item and NPC databases,
 * maps, shops, recruitable characters).
 *
 * A category with no entries is treated as "not provided" and is not
 * checked against.
 */
struct ContentReferences {
    std::unordered_set<MonsterId> monsters;
    std::unordered_set<ItemId> items;
    std::unordered_set<NpcId> npcs;
    std::unordered_set<MapId> maps;
    std::unordered_set<ShopId> shops;
    std::unordered_set<std::string> characters;

    bool hasMonster(MonsterId id) const { return monsters.empty() || monsters.count(id) > 0; }
    bool hasItem(ItemId id) const { return items.empty() || items.count(id) > 0; }
    bool hasNpc(NpcId id) const { return npcs.empty() || npcs.count(id) > 0; }
    bool hasMap(MapId id) const { return maps.empty() || maps.count(id) > 0; }
    bool hasShop(ShopId id) const { return shops.empty() || shops.count(id) > 0; }
    bool hasCharacter(const std::string& id) const {
        return characters.empty() || characters.count(id) > 0;
    }
};

} // namespace Parley
