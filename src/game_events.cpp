#include "game.hpp"

#include <algorithm>
#include <cctype>

namespace {

// Lowercased answer with surrounding whitespace removed.
std::string normalizeAnswer(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char ch : raw) {
        if (std::isspace(ch)) continue;
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

} // namespace

std::optional<EventCard> Game::drawDevCard() {
    if (board_.devCards().empty()) {
        // Rolls the clock over (or ends the game) before drawing.
        if (checkGameOver()) return std::nullopt;
    }
    return board_.devCards().draw();
}

void Game::resolveEvent() {
    std::optional<EventCard> card = drawDevCard();
    if (!card) {
        publishSnapshot();
        return;
    }

    const EventContent& ev = card->contentAt(board_.hourIndex());
    pushMsg(toUpper(board_.time()) + ": " + toUpper(describeEvent(ev)), MessageKind::System);

    bool ranAway = false;
    switch (ev.kind) {
        case EventKind::Zombies:
            ranAway = runAwayOrFight(ev.value);
            break;
        case EventKind::Item:
            findItem();
            break;
        case EventKind::Health:
            player_.health += ev.value;
            if (ev.value > 0) {
                pushMsg("YOU GAIN " + std::to_string(ev.value) + " HEALTH.", MessageKind::Success);
            } else if (ev.value < 0) {
                pushMsg("YOU LOSE " + std::to_string(-ev.value) + " HEALTH.", MessageKind::Combat);
            } else {
                pushMsg("NOTHING HAPPENS.", MessageKind::Info);
            }
            break;
        default:
            break;
    }

    if (!checkGameOver() && !ranAway) {
        applyRoomBonus();
    }
    publishSnapshot();
}

bool Game::runAwayOrFight(int zombies) {
    pushMsg(std::to_string(zombies) + " ZOMBIES ATTACK!", MessageKind::Combat);

    const std::vector<Direction> escapes = escapeDirections();
    if (escapes.empty()) {
        pushMsg("THERE IS NOWHERE TO RUN. YOU MUST FIGHT!", MessageKind::Warning);
        fightZombies(zombies);
        return false;
    }

    publishSnapshot();
    const std::string answer = askChoice(ChoiceKind::FightOrRun, "FIGHT (F) OR RUN (R)?", {"F", "R"},
                                         "INVALID CHOICE. ENTER 'F' OR 'R'.");
    if (answer == "R") {
        return escapeZombies();
    }
    fightZombies(zombies);
    return false;
}

bool Game::escapeZombies() {
    const std::vector<Direction> escapes = escapeDirections();
    if (escapes.empty()) return false;

    const Direction d = askDirection(ChoiceKind::EscapeDirection, "CHOOSE A DIRECTION TO RUN:", escapes,
                                     "YOU CAN'T RUN THAT WAY.");
    player_.location = stepFrom(player_.location, d);
    pushMsg("YOU RUN INTO THE " + toUpper(currentRoom().name) + ".", MessageKind::Info);

    // An item that negates escape damage is used up instead of health.
    for (const std::string& item : player_.items) {
        const ItemDef* def = findItemDef(content_.items, item);
        if (def && def->negatesEscapeDamage) {
            const std::string used = item;
            loseItem(used);
            pushMsg("YOU USE THE " + toUpper(used) + " TO COVER YOUR ESCAPE.", MessageKind::Loot);
            return true;
        }
    }

    player_.health -= 1;
    pushMsg("YOU ESCAPE BUT LOSE 1 HEALTH.", MessageKind::Combat);
    return true;
}

int Game::fightZombies(int zombies) {
    int damage = zombies - player_.attack;
    if (damage < 0) {
        pushMsg("YOU FIGHT OFF THE ZOMBIES WITHOUT A SCRATCH.", MessageKind::Combat);
        return 0;
    }
    damage = std::min(damage, MAX_ZOMBIE_DAMAGE);
    player_.health -= damage;
    if (damage == 0) {
        pushMsg("YOU FIGHT OFF THE ZOMBIES WITHOUT A SCRATCH.", MessageKind::Combat);
    } else {
        pushMsg("YOU FIGHT THE ZOMBIES AND TAKE " + std::to_string(damage) + " DAMAGE.", MessageKind::Combat);
    }
    return damage;
}

void Game::findItem() {
    if (checkGameOver()) return;

    std::optional<EventCard> card = drawDevCard();
    if (!card) return;
    const std::string item = card->name;

    if (!player_.atCapacity()) {
        gainItem(item);
        return;
    }

    pushMsg("YOU FOUND " + toUpper(item) + " BUT YOUR HANDS ARE FULL.", MessageKind::Loot);
    const std::string answer = askChoice(ChoiceKind::ReplaceItem,
                                         "REPLACE AN ITEM WITH THE " + toUpper(item) + "? (N/Y)", {"N", "Y"},
                                         "INVALID CHOICE. ENTER 'Y' OR 'N'.");
    if (answer != "Y") {
        pushMsg("YOU LEAVE THE " + toUpper(item) + " BEHIND.", MessageKind::Loot);
        return;
    }

    const std::string old = askChoice(ChoiceKind::ItemToReplace, "WHICH ITEM DO YOU DROP?", player_.items,
                                      "YOU ARE NOT CARRYING THAT.");
    loseItem(old);
    gainItem(item);
}

void Game::gainItem(const std::string& item) {
    player_.items.push_back(item);
    pushMsg("YOU PICK UP THE " + toUpper(item) + ".", MessageKind::Loot);

    const ItemDef* def = findItemDef(content_.items, item);
    if (!def) return;
    if (def->attackBonus != 0) {
        player_.attack += def->attackBonus;
        pushMsg("ATTACK +" + std::to_string(def->attackBonus) + ".", MessageKind::Success);
    }
    if (def->healthBonus != 0) {
        player_.health += def->healthBonus;
        pushMsg("HEALTH +" + std::to_string(def->healthBonus) + ".", MessageKind::Success);
    }
}

void Game::loseItem(const std::string& item) {
    if (!player_.removeItem(item)) return;
    pushMsg("YOU DROP THE " + toUpper(item) + ".", MessageKind::Loot);

    const ItemDef* def = findItemDef(content_.items, item);
    if (def && def->attackBonus != 0) {
        player_.attack -= def->attackBonus;
    }
}

void Game::applyRoomBonus() {
    const std::string& room = currentRoom().name;
    if (isRoom(room, content_.rooms.healRooms)) {
        player_.health += 1;
        pushMsg("THE " + toUpper(room) + " LETS YOU PATCH YOURSELF UP. +1 HEALTH.", MessageKind::Success);
    } else if (isRoom(room, content_.rooms.scavengeRooms)) {
        pushMsg("YOU SCAVENGE THE " + toUpper(room) + ".", MessageKind::Loot);
        findItem();
    }
}

bool Game::checkGameOver() {
    if (isFinished()) return true;

    if (player_.isDead()) {
        endGame(GameOutcome::DiedOfWounds, "YOU DIED OF YOUR WOUNDS.");
        return true;
    }

    if (board_.devCards().empty()) {
        if (board_.isLastHour()) {
            endGame(GameOutcome::OutOfTime, "YOU RAN OUT OF TIME. THE ZOMBIES OVERRUN THE HOUSE.");
            return true;
        }
        board_.updateTime();
        pushMsg("THE CLOCK STRIKES " + toUpper(board_.time()) + ".", MessageKind::System);
    }
    return false;
}

void Game::endGame(GameOutcome outcome, const std::string& cause) {
    outcome_ = outcome;
    endCause_ = cause;
    pushMsg(cause, outcome == GameOutcome::Won ? MessageKind::Success : MessageKind::System);

    for (auto& o : observers_) {
        if (o.second.onGameEnded) o.second.onGameEnded(outcome_, endCause_);
    }
    publishSnapshot();
}

std::string Game::askChoice(ChoiceKind kind, const std::string& prompt,
                            const std::vector<std::string>& options, const std::string& invalidMsg) {
    if (options.empty()) return std::string();

    // No one to ask: take the first option.
    if (!choose_) return options.front();

    const ChoiceRequest req{kind, prompt, options};
    for (;;) {
        const std::string raw = choose_(req);
        const std::string answer = normalizeAnswer(raw);
        for (const std::string& opt : options) {
            if (answer == normalizeAnswer(opt)) return opt;
        }
        if (kind == ChoiceKind::EntrySide || kind == ChoiceKind::EscapeDirection) {
            Direction d;
            if (parseDirection(raw, d)) {
                const std::string letter(1, dirChar(d));
                for (const std::string& opt : options) {
                    if (opt == letter) return opt;
                }
            }
        }
        pushMsg(invalidMsg, MessageKind::Warning);
    }
}

Direction Game::askDirection(ChoiceKind kind, const std::string& prompt,
                             const std::vector<Direction>& dirs, const std::string& invalidMsg) {
    std::vector<std::string> options;
    options.reserve(dirs.size());
    for (Direction d : dirs) options.emplace_back(1, dirChar(d));

    const std::string answer = askChoice(kind, prompt + " " + joinList(options), options, invalidMsg);
    const Direction fallback = dirs.empty() ? Direction::North : dirs.front();
    Direction out = fallback;
    if (!parseDirection(answer, out)) out = fallback;
    return out;
}
