#include "board.hpp"
#include "content.hpp"
#include "deck.hpp"
#include "events.hpp"
#include "game.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "tile.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Answers prompts from a fixed list and records every question asked.
// Once the list runs out it picks the first option.
struct ScriptedChoices {
    std::vector<std::string> answers;
    size_t next = 0;
    std::vector<ChoiceRequest> asked;

    ChoiceFn fn() {
        return [this](const ChoiceRequest& req) {
            asked.push_back(req);
            if (next < answers.size()) return answers[next++];
            return req.options.empty() ? std::string() : req.options.front();
        };
    }

    int count(ChoiceKind k) const {
        int n = 0;
        for (const ChoiceRequest& r : asked) {
            if (r.kind == k) ++n;
        }
        return n;
    }
};

EventContent quietEvent() {
    return EventContent{EventKind::Health, 0, "Nothing stirs."};
}

EventCard quietCard(const std::string& item, size_t hours = 3) {
    return EventCard{item, std::vector<EventContent>(hours, quietEvent())};
}

EventCard cardWith(const std::string& item, EventContent first, size_t hours = 3) {
    EventCard c = quietCard(item, hours);
    c.contents[0] = first;
    return c;
}

Tile room(const std::string& name, const std::string& exits, TileCategory cat = TileCategory::Indoor) {
    return Tile(name, exitsFromString(exits), cat);
}

// Small house with unshuffled decks: the start room plus whatever the test needs.
GameContent scriptedContent(std::vector<Tile> indoorAfterFoyer, std::vector<EventCard> cards) {
    GameContent c = defaultContent();
    c.indoorTiles = {room("Foyer", "N")};
    for (Tile& t : indoorAfterFoyer) c.indoorTiles.push_back(std::move(t));
    c.outdoorTiles = {room("Patio", "ESW", TileCategory::Outdoor), room("Garden", "NEW", TileCategory::Outdoor),
                      room("Yard", "NS", TileCategory::Outdoor)};
    c.eventCards = std::move(cards);
    return c;
}

std::vector<EventCard> quietCards(int n, size_t hours = 3) {
    std::vector<EventCard> out;
    for (int i = 0; i < n; ++i) out.push_back(quietCard("Candle", hours));
    return out;
}

GameConfig scriptedConfig() {
    GameConfig cfg;
    cfg.shuffleDecks = false;
    return cfg;
}

std::filesystem::path tempFile(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_direction_helpers() {
    for (Direction d : ALL_DIRECTIONS) {
        expect(opposite(opposite(d)) == d, std::string("opposite twice for ") + dirName(d));
        const Coord back = stepFrom(stepFrom(Coord{3, 3}, d), opposite(d));
        expect(back == Coord{3, 3}, std::string("step and step back for ") + dirName(d));
    }
    expect(stepFrom(Coord{3, 3}, Direction::North) == Coord{2, 3}, "north decreases the row");
    expect(stepFrom(Coord{3, 3}, Direction::East) == Coord{3, 4}, "east increases the column");

    Direction d = Direction::North;
    expect(parseDirection("w", d) && d == Direction::West, "parse 'w'");
    expect(parseDirection("South", d) && d == Direction::South, "parse 'South'");
    expect(!parseDirection("up", d), "'up' is not a direction");
}

void test_rotation_order_four() {
    const char* shapes[] = {"N", "NE", "NS", "NEW", "ESW", "NESW"};
    for (const char* s : shapes) {
        Tile t = room("Room", s);
        const ExitSet before = t.exits;
        for (int i = 0; i < 4; ++i) t.rotateClockwise();
        expect(t.exits == before, std::string("four quarter turns restore ") + s);
        expect(t.rotation == 0, std::string("rotation counter wraps for ") + s);
    }

    // Turning by the same entry/exit pair four times is the identity.
    for (Direction entry : ALL_DIRECTIONS) {
        for (Direction exit : ALL_DIRECTIONS) {
            Tile r = room("Room", "NEW");
            const ExitSet before = r.exits;
            for (int i = 0; i < 4; ++i) r.rotate(entry, exit);
            expect(r.exits == before,
                   std::string("four turns for entry ") + dirChar(entry) + " exit " + dirChar(exit) + " restore the exits");
        }
    }

    Tile t = room("Room", "NE");
    t.rotateClockwise();
    expect(exitsToString(t.exits) == "ES", "one clockwise turn maps NE to ES");
}

void test_rotation_table_matches_formula() {
    for (Direction entry : ALL_DIRECTIONS) {
        for (Direction exit : ALL_DIRECTIONS) {
            const int want = ((dirIndex(opposite(exit)) - dirIndex(entry)) % 4 + 4) % 4;
            expect(rotationCount(entry, exit) == want,
                   std::string("rotation count for entry ") + dirChar(entry) + " exit " + dirChar(exit));

            // The chosen entry side ends up facing the room the player came from.
            Tile t = Tile("Room", ExitSet{}, TileCategory::Indoor);
            t.addExit(entry);
            t.rotate(entry, exit);
            expect(t.hasExit(opposite(exit)),
                   std::string("entry ") + dirChar(entry) + " faces back after moving " + dirChar(exit));
        }
    }
}

void test_tile_ascii() {
    const std::string art = room("Kitchen", "NE").toAscii();
    expect(art.find("Kitchen") != std::string::npos, "ASCII art shows the room name");
    expect(room("Kitchen", "NE").possibleExitsText() == "[N, E]", "exit list text");
}

void test_deck_draw_and_by_name() {
    Deck<Tile> deck({room("A", "N"), room("B", "N"), room("C", "N"), room("D", "N")}, "Test");
    expect(deck.count() == 4, "deck starts with four cards");

    std::optional<Tile> c = deck.drawByName("C");
    expect(c && c->name == "C", "drawByName finds C");
    expect(deck.count() == 3, "drawByName removes one card");
    expect(!deck.drawByName("C"), "C is gone");

    const std::vector<Tile>& rest = deck.peekAll();
    expect(rest.size() == 3 && rest[0].name == "A" && rest[1].name == "B" && rest[2].name == "D",
           "drawByName keeps the order of the other cards");

    std::optional<Tile> top = deck.draw();
    expect(top && top->name == "A", "draw takes the top card");
    expect(deck.count() == 2, "draw removes exactly one card");

    deck.draw();
    deck.draw();
    expect(deck.empty(), "deck is empty after drawing everything");
    expect(!deck.draw(), "drawing from an empty deck yields nothing");
}

void test_deck_seeded_shuffle() {
    const GameContent c = defaultContent();
    Board a(c, Coord{3, 3}, 777u);
    Board b(c, Coord{3, 3}, 777u);

    bool same = a.indoorTiles().count() == b.indoorTiles().count();
    for (int i = 0; same && i < a.indoorTiles().count(); ++i) {
        same = a.indoorTiles().peekAll()[static_cast<size_t>(i)].name == b.indoorTiles().peekAll()[static_cast<size_t>(i)].name;
    }
    expect(same, "the same seed shuffles the same indoor order");
}

void test_default_content_and_board_setup() {
    const GameContent c = defaultContent();
    std::string err;
    expect(validateContent(c, &err), "stock content validates: " + err);
    expect(c.indoorTiles.size() == 8, "8 indoor tiles");
    expect(c.outdoorTiles.size() == 8, "8 outdoor tiles");
    expect(c.eventCards.size() == 9, "9 development cards");
    expect(c.clockLabels.size() == 3 && c.clockLabels.front() == "9 PM", "clock starts at 9 PM");

    Board board(c, Coord{3, 3}, 5u);
    const Tile* foyer = board.tileAt(Coord{3, 3});
    expect(foyer && foyer->name == "Foyer", "foyer placed at the start");
    expect(foyer && foyer->rotation == 0, "foyer placed unrotated");
    expect(board.indoorTiles().count() == 7, "foyer removed from the indoor deck");
    expect(board.outdoorTiles().count() == 7, "patio reserved out of the outdoor deck");
    expect(!board.indoorTiles().contains("Foyer"), "no second foyer");
    expect(board.hasCompanion(), "patio waiting for the dining room");
    expect(board.devCards().count() == 9, "full development deck");
    expect(board.time() == "9 PM", "board time starts at 9 PM");
}

void test_invalid_and_blocked_moves() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());

    expect(game.move(Direction::East) == ActionResult::Rejected, "no east exit from the foyer");
    expect(game.player().location == Coord{3, 3}, "rejected move keeps the player in place");

    game.boardMut().place(Coord{2, 3}, room("Bedroom", "E"));
    expect(game.move(Direction::North) == ActionResult::Rejected, "wall on the far side blocks the move");
    expect(game.player().location == Coord{3, 3}, "blocked move keeps the player in place");
}

void test_exhausted_deck() {
    GameContent c = scriptedContent({}, quietCards(6));
    Game game(c, scriptedConfig());

    expect(game.move(Direction::North) == ActionResult::Exhausted, "empty indoor deck");
    expect(game.player().location == Coord{3, 3}, "exhausted move keeps the player in place");
    expect(!game.isFinished(), "running out of tiles does not end the game");
}

void test_single_exit_auto_align() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    game.setChoiceProvider(script.fn());

    expect(game.move(Direction::North) == ActionResult::Ok, "move into a new room");
    const Tile* t = game.board().tileAt(Coord{2, 3});
    expect(t && t->name == "Bathroom", "bathroom placed north of the foyer");
    expect(t && t->hasExit(Direction::South) && t->possibleExits().size() == 1, "bathroom door faces the foyer");
    expect(script.count(ChoiceKind::EntrySide) == 0, "single-exit room needs no entry choice");
    expect(game.player().location == Coord{2, 3}, "player stands in the new room");
    expect(game.board().devCards().count() == 5, "entering a new room resolves one card");
    expect(game.turnSequenceComplete(), "move completes a turn sequence");
}

void test_entry_choice_rotates_room() {
    GameContent c = scriptedContent({room("Bedroom", "NE")}, quietCards(6));
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    script.answers = {"east"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    expect(script.count(ChoiceKind::EntrySide) == 1, "two-exit room asks for an entry side");
    expect(!script.asked.empty() && script.asked[0].options == std::vector<std::string>({"N", "E"}),
           "entry options are the room's exits");

    const Tile* t = game.board().tileAt(Coord{2, 3});
    expect(t && exitsToString(t->exits) == "ES", "entering from E turns NE into ES");
}

void test_heal_room_bonus() {
    GameContent c = scriptedContent({room("Kitchen", "NE")}, quietCards(6));
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    expect(game.player().health == 7, "kitchen heals one after the event");
}

void test_combat_damage() {
    GameContent c = scriptedContent({}, quietCards(3));
    Game game(c, scriptedConfig());

    game.playerMut().attack = 2;
    game.playerMut().health = 6;
    expect(game.fightZombies(3) == 1 && game.player().health == 5, "3 zombies vs attack 2 deals 1");

    game.playerMut().attack = 5;
    game.playerMut().health = 6;
    expect(game.fightZombies(2) == 0 && game.player().health == 6, "2 zombies vs attack 5 deals nothing");

    game.playerMut().attack = 0;
    game.playerMut().health = 6;
    expect(game.fightZombies(10) == Game::MAX_ZOMBIE_DAMAGE && game.player().health == 2,
           "damage is capped at 4");
}

void test_cower() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());

    expect(game.cower() == ActionResult::Rejected, "cannot cower before moving");

    game.move(Direction::North);
    const int cards = game.board().devCards().count();
    expect(game.cower() == ActionResult::Ok, "cower after a move");
    expect(game.player().health == 9, "cowering heals 3");
    expect(game.board().devCards().count() == cards - 1, "cowering discards one card");
    expect(!game.turnSequenceComplete(), "cowering clears the turn sequence");

    expect(game.cower() == ActionResult::Rejected, "cannot cower twice in a row");
    expect(game.player().health == 9, "rejected cower changes nothing");
    expect(game.bash(Direction::West) == ActionResult::Rejected, "cannot bash after cowering");
}

void test_bash_rules() {
    GameContent c = scriptedContent({room("Bathroom", "N"), room("Closet", "N")}, quietCards(8));
    Game game(c, scriptedConfig());

    expect(game.bash(Direction::West) == ActionResult::Rejected, "cannot bash before moving");

    game.move(Direction::North);
    expect(game.bash(Direction::South) == ActionResult::Rejected, "cannot bash through an open exit");
    expect(game.player().location == Coord{2, 3}, "rejected bash keeps the player in place");

    const int cards = game.board().devCards().count();
    expect(game.bash(Direction::West) == ActionResult::Ok, "bash into an unexplored room");
    const Tile* closet = game.board().tileAt(Coord{2, 2});
    const Tile* bath = game.board().tileAt(Coord{2, 3});
    expect(closet && closet->name == "Closet" && closet->hasExit(Direction::East), "closet door faces the bathroom");
    expect(bath && bath->hasExit(Direction::West), "bathroom gained a west exit");
    expect(game.player().location == Coord{2, 2}, "player moved through the new hole");
    expect(game.player().health == 4, "bashing fights 3 zombies");
    expect(game.board().devCards().count() == cards - 1, "the new room resolves an event");
}

void test_bash_exhausted_deck() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    const int cards = game.board().devCards().count();

    expect(game.bash(Direction::West) == ActionResult::Exhausted, "no indoor rooms left to bash into");
    const Tile* bath = game.board().tileAt(Coord{2, 3});
    expect(bath && !bath->hasExit(Direction::West), "no hole knocked in the wall");
    expect(game.player().location == Coord{2, 3}, "player stays put");
    expect(game.player().health == 6, "no bash fight");
    expect(game.board().devCards().count() == cards, "no card spent");
    expect(game.board().tileAt(Coord{2, 2}) == nullptr, "nothing placed");
    expect(!game.isFinished(), "game goes on");
}

void test_bash_into_explored_neighbor() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    game.boardMut().place(Coord{2, 4}, room("Storage", "N"));

    expect(game.bash(Direction::East) == ActionResult::Ok, "bash into an explored room");
    const Tile* bath = game.board().tileAt(Coord{2, 3});
    const Tile* storage = game.board().tileAt(Coord{2, 4});
    expect(bath && bath->hasExit(Direction::East), "bathroom gained an east exit");
    expect(storage && storage->hasExit(Direction::West), "storage gained a matching west exit");
    expect(game.player().location == Coord{2, 4}, "player moved into the neighbour");
    expect(game.player().health == 4, "bash fight costs 2 at attack 1");

    // The new doorway is walkable both ways.
    expect(game.move(Direction::West) == ActionResult::Ok, "walk back through the bashed wall");
}

void test_bash_death_skips_event() {
    GameContent c = scriptedContent({room("Bathroom", "N"), room("Closet", "N")}, quietCards(8));
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    game.playerMut().health = 2;
    const int cards = game.board().devCards().count();

    game.bash(Direction::West);
    expect(game.outcome() == GameOutcome::DiedOfWounds, "bash fight can kill");
    expect(game.board().tileAt(Coord{2, 2}) != nullptr, "the room is still placed");
    expect(game.board().devCards().count() == cards, "no event after dying in the bash");
}

void test_death_ends_game() {
    const EventContent horde{EventKind::Zombies, 10, "A horde."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Candle", horde), cardWith("Candle", horde),
                                                              quietCard("Candle")});
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    script.answers = {"F", "F"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    expect(game.player().health == 2, "first horde deals the capped 4");
    expect(!game.isFinished(), "still alive at 2 health");

    game.move(Direction::South);
    expect(game.outcome() == GameOutcome::DiedOfWounds, "second horde kills");
    expect(game.isGameOver() && !game.isGameWon(), "death is a loss");
    expect(game.move(Direction::North) == ActionResult::Finished, "no actions after the game ends");
    expect(game.cower() == ActionResult::Finished, "no cowering after the game ends");
}

void test_explore_then_die() {
    const EventContent horde{EventKind::Zombies, 10, "A horde."};
    GameContent c = scriptedContent({room("Family Room", "NEW"), room("Bathroom", "N")},
                                    {quietCard("Candle"), quietCard("Candle"), cardWith("Candle", horde),
                                     cardWith("Candle", horde), quietCard("Candle")});
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    script.answers = {"S", "W", "F", "F"};
    game.setChoiceProvider(script.fn());

    expect(game.move(Direction::North) == ActionResult::Ok, "leave the foyer");
    expect(script.count(ChoiceKind::EntrySide) == 2, "entry side outside the room's exits is asked again");
    const Tile* family = game.board().tileAt(Coord{2, 3});
    expect(family && exitsToString(family->exits) == "NSW", "family room entered from W faces the foyer");

    expect(game.move(Direction::West) == ActionResult::Ok, "explore a single-exit room");
    expect(script.count(ChoiceKind::EntrySide) == 2, "no entry choice for the single-exit room");
    const Tile* bath = game.board().tileAt(Coord{2, 2});
    expect(bath && bath->hasExit(Direction::East), "bathroom door faces the family room");

    game.move(Direction::East);
    expect(game.player().health == 2, "first fight costs the capped 4");
    game.move(Direction::West);
    expect(game.outcome() == GameOutcome::DiedOfWounds, "second fight ends the game");
    expect(script.count(ChoiceKind::FightOrRun) == 2, "each horde offered fight or run");
}

void test_clock_advance_and_time_out() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(2, 2));
    c.clockLabels = {"9 PM", "10 PM"};
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    game.move(Direction::South);
    expect(game.board().time() == "10 PM", "empty deck advances the clock");
    expect(game.board().devCards().count() == 2, "new hour starts a full pass of cards");
    expect(!game.isFinished(), "advancing the clock does not end the game");

    game.move(Direction::North);
    game.move(Direction::South);
    expect(game.outcome() == GameOutcome::OutOfTime, "empty deck in the last hour loses on time");
    expect(game.move(Direction::North) == ActionResult::Finished, "finished game refuses moves");
}

void test_totem_find_and_bury() {
    GameContent c = scriptedContent({room("Evil Temple", "N")}, quietCards(9));
    Game game(c, scriptedConfig());

    expect(game.findOrBuryTotem() == ActionResult::Rejected, "no totem in the foyer");

    game.boardMut().place(Coord{8, 8}, room("Graveyard", "N", TileCategory::Outdoor));
    game.playerMut().location = Coord{8, 8};
    expect(game.findOrBuryTotem() == ActionResult::Rejected, "cannot bury without the totem");
    expect(game.messages().back().text.find("TOTEM") != std::string::npos, "refused burial says why");
    expect(!game.isFinished(), "failed burial does not end the game");

    game.playerMut().location = Coord{3, 3};
    game.move(Direction::North);
    expect(game.currentRoom().name == "Evil Temple", "reached the temple");
    const int cards = game.board().devCards().count();
    expect(game.findOrBuryTotem() == ActionResult::Ok, "search the temple");
    expect(game.player().hasTotem, "totem found");
    expect(game.board().devCards().count() == cards - 1, "searching resolves an event");
    expect(game.findOrBuryTotem() == ActionResult::Ok, "searching again is allowed");
    expect(game.player().hasTotem && game.board().devCards().count() == cards - 2, "second search spends a card");

    game.playerMut().location = Coord{8, 8};
    expect(game.findOrBuryTotem() == ActionResult::Ok, "bury the totem");
    expect(game.outcome() == GameOutcome::Won && game.isGameWon(), "burying the totem wins");
    expect(game.move(Direction::North) == ActionResult::Finished, "won game refuses moves");
}

void test_escape_costs_health() {
    const EventContent zombies{EventKind::Zombies, 5, "Zombies."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {quietCard("Candle"), cardWith("Candle", zombies),
                                                              quietCard("Candle")});
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    script.answers = {"R", "N"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    game.move(Direction::South);
    expect(script.count(ChoiceKind::FightOrRun) == 1, "asked to fight or run");
    expect(script.count(ChoiceKind::EscapeDirection) == 1, "asked where to run");
    expect(game.player().location == Coord{2, 3}, "ran back into the bathroom");
    expect(game.player().health == 5, "running away costs 1 health");
}

void test_escape_with_oil() {
    const EventContent zombies{EventKind::Zombies, 5, "Zombies."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {quietCard("Candle"), cardWith("Candle", zombies),
                                                              quietCard("Candle")});
    Game game(c, scriptedConfig());
    game.playerMut().items = {"Oil"};
    ScriptedChoices script;
    script.answers = {"x", "r", "north"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    game.move(Direction::South);
    expect(script.count(ChoiceKind::FightOrRun) == 2, "invalid answer is asked again");
    expect(game.player().health == 6, "oil covers the escape");
    expect(game.player().items.empty(), "oil is used up");
    expect(game.player().location == Coord{2, 3}, "escaped north");
}

void test_forced_fight_without_escape() {
    const EventContent zombies{EventKind::Zombies, 3, "Zombies."};
    GameContent c = scriptedContent({}, {cardWith("Candle", zombies), quietCard("Candle")});
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    game.setChoiceProvider(script.fn());

    game.boardMut().place(Coord{9, 9}, room("Evil Temple", "N"));
    game.playerMut().location = Coord{9, 9};
    game.findOrBuryTotem();

    expect(script.count(ChoiceKind::FightOrRun) == 0, "no choice when nothing is explored nearby");
    expect(game.player().health == 4, "forced fight against 3 zombies");
    expect(game.player().hasTotem, "totem still found after the fight");
}

void test_item_pickup_and_bonuses() {
    const EventContent find{EventKind::Item, 0, "Something useful."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Oil", find), quietCard("Candle"),
                                                              quietCard("Oil")});
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    expect(game.player().items == std::vector<std::string>({"Candle"}), "item card adds the next card's item");
    expect(game.player().attack == 1, "a candle gives no attack bonus");

    const std::vector<ItemDef> defs = defaultItemDefs();
    const ItemDef* femur = findItemDef(defs, "grisly femur");
    const ItemDef* nails = findItemDef(defs, "Board with Nails");
    const ItemDef* club = findItemDef(defs, "Golf Club");
    const ItemDef* candle = findItemDef(defs, "Candle");
    expect(femur && femur->attackBonus == 1, "grisly femur +1");
    expect(nails && nails->attackBonus == 1, "board with nails +1");
    expect(club && club->attackBonus == 1, "golf club +1");
    expect(candle && candle->attackBonus == 0, "candle +0");
    expect(!findItemDef(defs, "Banana"), "unknown items have no definition");
}

void test_soda_can_heals() {
    const EventContent find{EventKind::Item, 0, "Something useful."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Oil", find), quietCard("Soda Can"),
                                                              quietCard("Oil")});
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    expect(game.player().items == std::vector<std::string>({"Soda Can"}), "soda can picked up");
    expect(game.player().health == 8, "soda can gives 2 health on pickup");
    expect(game.player().attack == 1, "soda can is not a weapon");
}

void test_storage_scavenges_item() {
    GameContent c = scriptedContent({room("Storage", "N")}, {quietCard("Candle"), quietCard("Machete"),
                                                             quietCard("Candle"), quietCard("Candle")});
    Game game(c, scriptedConfig());

    game.move(Direction::North);
    expect(game.currentRoom().name == "Storage", "entered the storage");
    expect(game.player().items == std::vector<std::string>({"Machete"}), "storage turns up the next card's item");
    expect(game.player().attack == 3, "machete gives 2 attack");
    expect(game.board().devCards().count() == 2, "event and scavenge each spend a card");
}

void test_item_replacement() {
    const EventContent find{EventKind::Item, 0, "Something useful."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Oil", find), quietCard("Chainsaw"),
                                                              quietCard("Oil")});
    Game game(c, scriptedConfig());
    game.playerMut().items = {"Golf Club", "Candle"};
    game.playerMut().attack = 2;
    ScriptedChoices script;
    script.answers = {"y", "golf club"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    expect(script.count(ChoiceKind::ReplaceItem) == 1, "full hands ask before replacing");
    expect(game.player().items == std::vector<std::string>({"Candle", "Chainsaw"}), "golf club swapped for chainsaw");
    expect(game.player().attack == 4, "replaced item's bonus is revoked");
}

void test_item_replacement_declined() {
    const EventContent find{EventKind::Item, 0, "Something useful."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Oil", find), quietCard("Chainsaw"),
                                                              quietCard("Oil")});
    Game game(c, scriptedConfig());
    game.playerMut().items = {"Golf Club", "Candle"};
    game.playerMut().attack = 2;
    ScriptedChoices script;
    script.answers = {"N"};
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    expect(script.count(ChoiceKind::ItemToReplace) == 0, "declining skips the item question");
    expect(game.player().items == std::vector<std::string>({"Golf Club", "Candle"}), "inventory unchanged");
    expect(game.player().attack == 2, "attack unchanged");
    expect(game.board().devCards().count() == 1, "the found item's card is spent anyway");
}

void test_dining_room_places_patio() {
    GameContent c = scriptedContent({room("Dining Room", "NESW")}, quietCards(6));
    Game game(c, scriptedConfig());
    ScriptedChoices script;
    game.setChoiceProvider(script.fn());

    game.move(Direction::North);
    expect(script.count(ChoiceKind::EntrySide) == 0, "dining room placement needs no entry choice");
    const Tile* patio = game.board().tileAt(Coord{1, 3});
    expect(patio && patio->name == "Patio", "patio placed beyond the dining room");
    expect(patio && patio->hasExit(Direction::South), "patio door faces the dining room");
    expect(!game.board().hasCompanion(), "patio handed out once");

    expect(game.move(Direction::North) == ActionResult::Ok, "walk onto the patio");
    expect(game.move(Direction::East) == ActionResult::Ok, "explore outside");
    const Tile* outside = game.board().tileAt(Coord{1, 4});
    expect(outside && outside->category == TileCategory::Outdoor, "patio neighbours come from the outdoor deck");
}

void test_unattended_game_keeps_items() {
    const EventContent find{EventKind::Item, 0, "Something useful."};
    GameContent c = scriptedContent({room("Bathroom", "N")}, {cardWith("Oil", find), quietCard("Chainsaw"),
                                                              quietCard("Oil")});
    Game game(c, scriptedConfig());
    game.playerMut().items = {"Golf Club", "Candle"};

    game.move(Direction::North);
    expect(game.player().items == std::vector<std::string>({"Golf Club", "Candle"}),
           "without anyone to ask the found item is left behind");
}

void test_dining_room_blocked_patio_spot() {
    GameContent c = scriptedContent({room("Dining Room", "NESW")}, quietCards(6));
    Game game(c, scriptedConfig());
    game.boardMut().place(Coord{1, 3}, room("Evil Temple", "S"));
    ScriptedChoices script;
    script.answers = {"E"};
    game.setChoiceProvider(script.fn());

    expect(game.move(Direction::North) == ActionResult::Ok, "enter the dining room");
    const Tile* temple = game.board().tileAt(Coord{1, 3});
    expect(temple && temple->name == "Evil Temple", "explored room beyond the dining room survives");
    expect(game.board().hasCompanion(), "patio stays reserved");
    expect(script.count(ChoiceKind::EntrySide) == 1, "dining room placed like any other room");
    const Tile* dining = game.board().tileAt(Coord{2, 3});
    expect(dining && dining->name == "Dining Room" && dining->hasExit(Direction::South), "dining room faces the foyer");
}

void test_dining_room_heading_south() {
    GameContent c = scriptedContent({room("Dining Room", "NESW")}, quietCards(6));
    Game game(c, scriptedConfig());
    game.boardMut().tileAt(Coord{3, 3})->addExit(Direction::South);

    game.move(Direction::South);
    const Tile* dining = game.board().tileAt(Coord{4, 3});
    const Tile* patio = game.board().tileAt(Coord{5, 3});
    expect(dining && dining->rotation == 2, "dining room turned around");
    expect(patio && patio->name == "Patio", "patio placed south of the dining room");
    expect(patio && patio->hasExit(Direction::North) && !patio->hasExit(Direction::South),
           "turned patio faces the dining room");
}

void test_observers_and_messages() {
    GameContent c = scriptedContent({room("Bathroom", "N")}, quietCards(6));
    Game game(c, scriptedConfig());

    int tiles = 0;
    int snapshots = 0;
    int messages = 0;
    GameSnapshot last;
    GameObserver o;
    o.onTilePlaced = [&](const TilePlacedEvent&) { ++tiles; };
    o.onSnapshot = [&](const GameSnapshot& s) { ++snapshots; last = s; };
    o.onMessage = [&](const Message&) { ++messages; };
    const int id = game.addObserver(o);

    expect(tiles == 1, "new observer receives the placed foyer");
    expect(snapshots == 1, "new observer receives a snapshot");

    game.move(Direction::North);
    expect(tiles >= 2, "observer sees the new room");
    expect(last.location == Coord{2, 3} && last.devCardsLeft == 5, "snapshot follows the move");
    expect(messages > 0, "observer receives messages");

    game.removeObserver(id);
    const int before = tiles + snapshots + messages;
    game.move(Direction::South);
    expect(tiles + snapshots + messages == before, "removed observer gets nothing");

    game.inspect();
    game.inspect();
    expect(!game.messages().empty() && game.messages().back().repeat == 2, "repeated messages coalesce");
    expect(game.inspect().find("Health: 6") != std::string::npos, "details show health");
}

void test_content_ini_overrides() {
    const std::filesystem::path path = tempFile("zimp_content_test.ini");
    {
        std::ofstream out(path);
        out << "# test overrides\n";
        out << "clock = 8 PM, 9 PM, 10 PM\n";
        out << "tile.indoor.bathroom = none\n";
        out << "tile.outdoor.gazebo = N, S\n";
        out << "card.1.item = Lantern\n";
        out << "card.1.2 = zombies 2 | Scratching at the door\n";
        out << "card.10.item = Rope\n";
        out << "card.10.1 = item\n";
        out << "card.10.2 = health -2 | Splinters\n";
        out << "card.10.3 = zombies 3\n";
        out << "item.lantern.attack = 1\n";
        out << "neighbor.garage = indoor\n";
        out << "this line is junk\n";
        out << "tile.attic.x = N\n";
    }

    GameContent c = defaultContent();
    std::string warnings;
    expect(loadContentIni(path.string(), c, &warnings), "content file loads");
    expect(c.clockLabels == std::vector<std::string>({"8 PM", "9 PM", "10 PM"}), "clock overridden");
    expect(c.indoorTiles.size() == 7, "bathroom removed");
    expect(c.outdoorTiles.size() == 9 && c.outdoorTiles.back().name == "Gazebo", "gazebo added");
    expect(c.eventCards.size() == 10 && c.eventCards.back().name == "Rope", "tenth card appended");
    expect(c.eventCards[0].name == "Lantern", "card item renamed");
    expect(c.eventCards[0].contents[1].kind == EventKind::Zombies && c.eventCards[0].contents[1].value == 2,
           "card hour overridden");
    expect(c.eventCards.back().contents[1].value == -2, "health event parsed");
    const ItemDef* lantern = findItemDef(c.items, "Lantern");
    expect(lantern && lantern->attackBonus == 1, "new item definition");
    expect(c.neighborRules.count("garage") && c.neighborRules["garage"] == TileCategory::Indoor, "neighbour rule");
    expect(warnings.find("Line 13") != std::string::npos, "junk line reported");
    expect(warnings.find("Line 14") != std::string::npos, "unknown tile deck reported");
    expect(c.sourceHash != 0, "source hash recorded");

    std::string err;
    expect(validateContent(c, &err), "overridden content still validates: " + err);

    c.indoorTiles.erase(c.indoorTiles.begin());
    expect(!validateContent(c, &err), "content without a foyer is rejected");

    GameContent bad = defaultContent();
    bad.clockLabels.push_back("MIDNIGHT");
    expect(!validateContent(bad, &err), "card hours must match the clock");

    GameContent missing = defaultContent();
    expect(!loadContentIni(tempFile("zimp_no_such_file.ini").string(), missing), "missing file reported");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_settings_parsing() {
    const std::filesystem::path path = tempFile("zimp_settings_test.ini");
    {
        std::ofstream out(path);
        out << "seed = 42\n";
        out << "start_health = 8   # tougher\n";
        out << "item_capacity = 3\n";
        out << "start_row = 5\n";
        out << "tile_size = 1000\n";
        out << "vsync = no\n";
        out << "ascii_tiles = off\n";
        out << "content_file = house.ini\n";
        out << "nonsense without equals\n";
        out << "start_attack = lots\n";
    }

    const Settings s = loadSettings(path.string());
    expect(s.seed == 42u, "seed parsed");
    expect(s.startHealth == 8, "start health parsed (comment stripped)");
    expect(s.itemCapacity == 3, "capacity parsed");
    expect(s.startRow == 5 && s.startCol == 3, "start row parsed, column default");
    expect(s.tileSize == 192, "tile size clamped");
    expect(!s.vsync && !s.asciiTiles, "booleans parsed");
    expect(s.contentFile == "house.ini", "content file parsed");
    expect(s.startAttack == 1, "invalid value keeps the default");

    const GameConfig cfg = toGameConfig(s, 99u);
    expect(cfg.seed == 99u && cfg.startHealth == 8 && cfg.itemCapacity == 3, "game config from settings");
    expect(cfg.start == Coord{5, 3}, "start coordinate from settings");

    const std::filesystem::path defPath = tempFile("zimp_settings_default_test.ini");
    expect(writeDefaultSettings(defPath.string()), "default settings written");
    const Settings d = loadSettings(defPath.string());
    expect(d.seed == 0 && d.startHealth == 6 && d.itemCapacity == 2, "default settings round trip");

    const Settings none = loadSettings(tempFile("zimp_no_such_settings.ini").string());
    expect(none.startHealth == 6, "missing settings file gives defaults");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(defPath, ec);
}

} // namespace

int main() {
    std::cout << "Running ZombiePocket tests...\n";

    test_rng_reproducible();
    test_direction_helpers();
    test_rotation_order_four();
    test_rotation_table_matches_formula();
    test_tile_ascii();
    test_deck_draw_and_by_name();
    test_deck_seeded_shuffle();
    test_default_content_and_board_setup();

    test_invalid_and_blocked_moves();
    test_exhausted_deck();
    test_single_exit_auto_align();
    test_entry_choice_rotates_room();
    test_heal_room_bonus();
    test_combat_damage();
    test_cower();
    test_bash_rules();
    test_bash_exhausted_deck();
    test_bash_into_explored_neighbor();
    test_bash_death_skips_event();
    test_death_ends_game();
    test_explore_then_die();
    test_clock_advance_and_time_out();
    test_totem_find_and_bury();
    test_escape_costs_health();
    test_escape_with_oil();
    test_forced_fight_without_escape();
    test_item_pickup_and_bonuses();
    test_soda_can_heals();
    test_storage_scavenges_item();
    test_item_replacement();
    test_item_replacement_declined();
    test_dining_room_places_patio();
    test_unattended_game_keeps_items();
    test_dining_room_blocked_patio_spot();
    test_dining_room_heading_south();
    test_observers_and_messages();

    test_content_ini_overrides();
    test_settings_parsing();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
