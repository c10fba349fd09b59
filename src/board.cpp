#include "board.hpp"

#include <utility>

namespace {

// Per-purpose seed salts so the decks do not share a shuffle order.
constexpr uint32_t SALT_INDOOR = 0x494e4452u;
constexpr uint32_t SALT_OUTDOOR = 0x4f555444u;
constexpr uint32_t SALT_CARDS = 0x43415244u;

} // namespace

Board::Board(const GameContent& content, Coord start, uint32_t seed, bool shuffle)
    : allCards_(content.eventCards),
      clock_(content.clockLabels),
      neighborRules_(content.neighborRules),
      start_(start),
      seed_(seed),
      shuffle_(shuffle) {
    if (clock_.empty()) clock_.push_back("MIDNIGHT");

    indoor_ = makeDeck(DeckConfig<Tile>{"Indoor", content.indoorTiles, hashCombine(seed_, SALT_INDOOR), shuffle_});
    outdoor_ = makeDeck(DeckConfig<Tile>{"Outdoor", content.outdoorTiles, hashCombine(seed_, SALT_OUTDOOR), shuffle_});
    devCards_ = buildDevCardPass();

    // The start room is placed unrotated before the first action.
    if (std::optional<Tile> foyer = indoor_.drawByName(content.rooms.startRoom)) {
        foyer->category = TileCategory::Special;
        tiles_[start_] = std::move(*foyer);
    }

    companion_ = outdoor_.drawByName(content.rooms.companionRoom);
    if (companion_) companion_->category = TileCategory::Special;
}

Tile* Board::tileAt(Coord c) {
    auto it = tiles_.find(c);
    return it == tiles_.end() ? nullptr : &it->second;
}

const Tile* Board::tileAt(Coord c) const {
    auto it = tiles_.find(c);
    return it == tiles_.end() ? nullptr : &it->second;
}

void Board::place(Coord c, Tile tile) {
    tiles_[c] = std::move(tile);
}

TileCategory Board::neighborCategory(const Tile& room) const {
    auto it = neighborRules_.find(foldRoomName(room.name));
    if (it != neighborRules_.end()) return it->second;
    if (room.category == TileCategory::Outdoor) return TileCategory::Outdoor;
    return TileCategory::Indoor;
}

TileDraw Board::drawTile(const Tile& fromRoom) {
    TileDraw out;
    out.category = neighborCategory(fromRoom);
    out.tile = (out.category == TileCategory::Outdoor) ? outdoor_.draw() : indoor_.draw();
    return out;
}

std::optional<Tile> Board::takeCompanion() {
    std::optional<Tile> out = std::move(companion_);
    companion_.reset();
    return out;
}

const std::string& Board::time() const {
    return clock_[static_cast<size_t>(hour_)];
}

bool Board::updateTime() {
    if (isLastHour()) return false;
    ++hour_;
    devCards_ = buildDevCardPass();
    return true;
}

Deck<EventCard> Board::buildDevCardPass() const {
    const uint32_t passSeed = hashCombine(hashCombine(seed_, SALT_CARDS), static_cast<uint32_t>(hour_));
    return makeDeck(DeckConfig<EventCard>{"Development", allCards_, passSeed, shuffle_});
}
