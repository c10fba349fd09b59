#include "game.hpp"

#include <algorithm>

Game::Game(GameContent content, const GameConfig& cfg)
    : content_(std::move(content)),
      board_(content_, cfg.start, cfg.seed, cfg.shuffleDecks) {
    player_.location = cfg.start;
    player_.health = cfg.startHealth;
    player_.attack = cfg.startAttack;
    player_.itemCapacity = std::max(1, cfg.itemCapacity);

    if (board_.isExplored(cfg.start)) {
        pushMsg("YOU ARE IN THE " + toUpper(currentRoom().name) + ".", MessageKind::Info);
    } else {
        // Without a start room there is nothing to stand on; validateContent() prevents this.
        board_.place(cfg.start, Tile(content_.rooms.startRoom, exitsFromString("N"), TileCategory::Special));
        pushMsg("NO START ROOM IN THE TILE DECK. USING AN EMPTY " + toUpper(content_.rooms.startRoom) + ".",
                MessageKind::Warning);
    }
}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    // Coalesce consecutive identical messages to reduce spam.
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            for (auto& o : observers_) {
                if (o.second.onMessage) o.second.onMessage(last);
            }
            return;
        }
    }

    // Keep some scrollback
    if (msgs.size() > 400) {
        msgs.erase(msgs.begin(), msgs.begin() + 100);
    }
    msgs.push_back({s, kind, 1});

    for (auto& o : observers_) {
        if (o.second.onMessage) o.second.onMessage(msgs.back());
    }
}

void Game::pushSystemMessage(const std::string& msg) {
    pushMsg(msg, MessageKind::System);
}

int Game::addObserver(GameObserver obs) {
    const int id = nextObserverId_++;
    observers_.emplace_back(id, std::move(obs));

    const GameObserver& o = observers_.back().second;
    if (o.onTilePlaced) {
        for (const auto& kv : board_.tiles()) {
            o.onTilePlaced(TilePlacedEvent{kv.second.view(), kv.first});
        }
    }
    if (o.onSnapshot) o.onSnapshot(snapshot());
    if (o.onGameEnded && isFinished()) o.onGameEnded(outcome_, endCause_);
    return id;
}

void Game::removeObserver(int id) {
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [id](const std::pair<int, GameObserver>& o) { return o.first == id; }),
                     observers_.end());
}

GameSnapshot Game::snapshot() const {
    GameSnapshot s;
    s.devCardsLeft = board_.devCards().count();
    s.time = board_.time();
    s.indoorTilesLeft = board_.indoorTiles().count();
    s.outdoorTilesLeft = board_.outdoorTiles().count();
    s.health = player_.health;
    s.attack = player_.attack;
    s.items = player_.items;
    s.location = player_.location;
    s.hasTotem = player_.hasTotem;
    return s;
}

void Game::publishSnapshot() {
    const GameSnapshot s = snapshot();
    for (auto& o : observers_) {
        if (o.second.onSnapshot) o.second.onSnapshot(s);
    }
}

void Game::publishTile(Coord pos) {
    const Tile* t = board_.tileAt(pos);
    if (!t) return;
    const TilePlacedEvent ev{t->view(), pos};
    for (auto& o : observers_) {
        if (o.second.onTilePlaced) o.second.onTilePlaced(ev);
    }
}

const Tile& Game::currentRoom() const {
    // The player always stands on a placed room (the start room is placed at construction).
    return *board_.tileAt(player_.location);
}

Tile& Game::currentRoomMut() {
    return *board_.tileAt(player_.location);
}

std::vector<Direction> Game::escapeDirections() const {
    std::vector<Direction> out;
    for (Direction d : currentRoom().possibleExits()) {
        if (board_.isExplored(stepFrom(player_.location, d))) out.push_back(d);
    }
    return out;
}

bool Game::refuseIfFinished() {
    if (!isFinished()) return false;
    pushMsg("THE GAME IS OVER. " + endCause_, MessageKind::System);
    return true;
}

bool Game::isRoom(const std::string& roomName, const std::vector<std::string>& names) const {
    return std::find(names.begin(), names.end(), roomName) != names.end();
}

ActionResult Game::move(Direction d) {
    if (refuseIfFinished()) return ActionResult::Finished;

    const Tile& here = currentRoom();
    if (!here.hasExit(d)) {
        pushMsg("INVALID DIRECTION. CHOOSE FROM: " + here.possibleExitsText(), MessageKind::Warning);
        return ActionResult::Rejected;
    }

    const Coord target = stepFrom(player_.location, d);
    if (const Tile* room = board_.tileAt(target)) {
        // Doors must line up on both sides.
        if (!room->hasExit(opposite(d))) {
            pushMsg("THIS EXIT IS BLOCKED BY A WALL FROM ANOTHER ROOM.", MessageKind::Warning);
            return ActionResult::Rejected;
        }
        player_.location = target;
        pushMsg("YOU ENTER THE " + toUpper(room->name) + ".", MessageKind::Info);
        resolveEvent();
    } else {
        TileDraw drawn = board_.drawTile(here);
        if (!drawn.tile) {
            pushMsg("NO MORE " + toUpper(tileCategoryName(drawn.category)) + " TILES TO DRAW.", MessageKind::Warning);
            return ActionResult::Exhausted;
        }
        player_.location = target;
        placeNewTile(d, std::move(*drawn.tile), true);
    }

    turnSequenceComplete_ = true;
    cowered_ = false;
    return ActionResult::Ok;
}

void Game::placeNewTile(Direction moved, Tile tile, bool resolveAfter) {
    const Coord pos = player_.location;

    // Show the room as drawn while the player decides how to enter it.
    board_.place(pos, tile);
    publishTile(pos);

    const std::vector<Direction> exits = tile.possibleExits();
    if (exits.size() > 1) {
        if (tile.name != content_.rooms.companionAnchor || !placeCompanion(moved, tile)) {
            chooseEntry(moved, tile);
        }
    } else if (exits.size() == 1) {
        tile.rotate(exits.front(), moved);
    }

    const std::string name = tile.name;
    board_.place(pos, std::move(tile));
    publishTile(pos);
    pushMsg("YOU EXPLORE THE " + toUpper(name) + ".", MessageKind::Info);

    if (resolveAfter) {
        resolveEvent();
    } else {
        publishSnapshot();
    }
}

void Game::chooseEntry(Direction moved, Tile& tile) {
    const Direction entry = askDirection(ChoiceKind::EntrySide,
                                         "YOU FOUND THE " + toUpper(tile.name) + ". CHOOSE A SIDE TO ENTER FROM:",
                                         tile.possibleExits(), "INVALID ENTRY.");
    tile.rotate(entry, moved);
}

bool Game::placeCompanion(Direction moved, Tile& anchor) {
    if (!board_.hasCompanion()) return false;

    // The anchor's north doorway always leads to the companion room.
    Coord pos = player_.location;
    pos.row += (moved == Direction::South) ? 1 : -1;
    if (board_.isExplored(pos)) return false;

    std::optional<Tile> companion = board_.takeCompanion();
    if (!companion) return false;

    if (moved == Direction::South) {
        anchor.rotate(Direction::South, Direction::South);
        companion->rotate(Direction::South, Direction::South);
    }

    const std::string name = companion->name;
    board_.place(pos, std::move(*companion));
    publishTile(pos);
    pushMsg("THE " + toUpper(anchor.name) + " OPENS ONTO THE " + toUpper(name) + ".", MessageKind::Info);
    return true;
}

ActionResult Game::bash(Direction d) {
    if (refuseIfFinished()) return ActionResult::Finished;

    if (!turnSequenceComplete_) {
        if (cowered_) {
            pushMsg("YOU CAN'T BASH AFTER COWERING.", MessageKind::Warning);
        } else {
            pushMsg("YOU NEED TO COMPLETE A TURN SEQUENCE BEFORE BASHING.", MessageKind::Warning);
        }
        return ActionResult::Rejected;
    }

    if (!isCardinal(d)) {
        pushMsg("INVALID DIRECTION. PLEASE ENTER 'N', 'E', 'S', OR 'W'.", MessageKind::Warning);
        return ActionResult::Rejected;
    }

    if (currentRoom().hasExit(d)) {
        pushMsg(std::string("NO NEED TO BASH. A VALID EXIT EXISTS, USE 'GO ") + dirChar(d) + "'.", MessageKind::Warning);
        return ActionResult::Rejected;
    }

    const Coord from = player_.location;
    const Coord target = stepFrom(from, d);

    if (Tile* room = board_.tileAt(target)) {
        if (!room->hasExit(opposite(d))) room->addExit(opposite(d));
        currentRoomMut().addExit(d);
        publishTile(from);
        publishTile(target);

        player_.location = target;
        pushMsg("YOU BASH THROUGH THE WALL INTO THE " + toUpper(room->name) + "!", MessageKind::Combat);
        fightZombies(BASH_ZOMBIES);
        checkGameOver();
        publishSnapshot();
    } else {
        TileDraw drawn = board_.drawTile(currentRoom());
        if (!drawn.tile) {
            pushMsg("CAN'T BASH FROM THE " + toUpper(currentRoom().name) + ", NO MORE "
                    + toUpper(tileCategoryName(drawn.category)) + " ROOMS TO EXPLORE.", MessageKind::Warning);
            return ActionResult::Exhausted;
        }
        currentRoomMut().addExit(d);
        publishTile(from);

        player_.location = target;
        pushMsg("YOU BASH THROUGH THE WALL!", MessageKind::Combat);
        fightZombies(BASH_ZOMBIES);
        const bool over = checkGameOver();
        placeNewTile(d, std::move(*drawn.tile), !over);
    }

    turnSequenceComplete_ = true;
    cowered_ = false;
    return ActionResult::Ok;
}

ActionResult Game::cower() {
    if (refuseIfFinished()) return ActionResult::Finished;

    if (!turnSequenceComplete_) {
        pushMsg("YOU NEED TO COMPLETE A TURN SEQUENCE BEFORE COWERING.", MessageKind::Warning);
        return ActionResult::Rejected;
    }

    turnSequenceComplete_ = false;
    cowered_ = true;

    player_.health += COWER_HEAL;
    pushMsg("YOU CURL UP IN A CORNER AND HIDE. +" + std::to_string(COWER_HEAL) + " HEALTH.", MessageKind::Info);

    if (drawDevCard()) {
        pushMsg("TIME PASSES. A DEVELOPMENT CARD IS DISCARDED.", MessageKind::System);
    }

    checkGameOver();
    publishSnapshot();
    return ActionResult::Ok;
}

ActionResult Game::findOrBuryTotem() {
    if (refuseIfFinished()) return ActionResult::Finished;

    const std::string& room = currentRoom().name;

    if (room == content_.rooms.totemFindRoom) {
        pushMsg("YOU ARE SEARCHING FOR THE TOTEM!", MessageKind::Info);
        resolveEvent();
        if (!checkGameOver()) {
            player_.hasTotem = true;
            pushMsg("YOU FOUND THE TOTEM!", MessageKind::Success);
            publishSnapshot();
        }
        return ActionResult::Ok;
    }

    if (room == content_.rooms.totemBuryRoom) {
        if (!player_.hasTotem) {
            pushMsg("YOU DON'T HAVE THE TOTEM!", MessageKind::Warning);
            return ActionResult::Rejected;
        }
        pushMsg("YOU ARE BURYING THE TOTEM!", MessageKind::Info);
        resolveEvent();
        if (!checkGameOver()) {
            endGame(GameOutcome::Won, "ALL ZOMBIES COLLAPSE. YOU WIN!");
        }
        return ActionResult::Ok;
    }

    pushMsg("YOU ARE NOT IN THE RIGHT ROOM! THE TOTEM IS FOUND IN THE " + toUpper(content_.rooms.totemFindRoom)
            + " AND BURIED IN THE " + toUpper(content_.rooms.totemBuryRoom) + ".", MessageKind::Warning);
    return ActionResult::Rejected;
}

std::string Game::inspect() {
    const std::string details = player_.detailsText();
    pushMsg(details, MessageKind::System);
    return details;
}
