#pragma once
#include "board.hpp"
#include "common.hpp"
#include "content.hpp"
#include "direction.hpp"
#include "events.hpp"
#include "player.hpp"
#include "tile.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    int repeat = 1;
};

// Outcome of one player action.
enum class ActionResult : uint8_t {
    Ok = 0,
    Rejected,  // invalid input for the current state; nothing changed
    Exhausted, // the deck this action needed is empty; nothing changed
    Finished,  // the game has already ended
};

enum class GameOutcome : uint8_t {
    InProgress = 0,
    Won,
    DiedOfWounds,
    OutOfTime,
};

// In-turn decisions the engine delegates to whoever is playing.
enum class ChoiceKind : uint8_t {
    EntrySide = 0,   // options: exit letters of the new room
    FightOrRun,      // options: "F", "R"
    EscapeDirection, // options: letters of explored neighbours
    ReplaceItem,     // options: "Y", "N"
    ItemToReplace,   // options: carried item names
};

struct ChoiceRequest {
    ChoiceKind kind = ChoiceKind::FightOrRun;
    std::string prompt;
    std::vector<std::string> options;
};

// Blocks until the player answers. Answers outside `options` are re-prompted.
using ChoiceFn = std::function<std::string(const ChoiceRequest&)>;

// Counters and player stats published after every resolved action.
struct GameSnapshot {
    int devCardsLeft = 0;
    std::string time;
    int indoorTilesLeft = 0;
    int outdoorTilesLeft = 0;
    int health = 0;
    int attack = 0;
    std::vector<std::string> items;
    Coord location{};
    bool hasTotem = false;
};

struct TilePlacedEvent {
    TileView tile;
    Coord pos{};
};

// Presentation hooks. Any of them may be left empty.
struct GameObserver {
    std::function<void(const GameSnapshot&)> onSnapshot;
    std::function<void(const TilePlacedEvent&)> onTilePlaced;
    std::function<void(const Message&)> onMessage;
    std::function<void(GameOutcome, const std::string&)> onGameEnded;
};

struct GameConfig {
    Coord start{3, 3};
    uint32_t seed = 1;
    bool shuffleDecks = true;

    int startHealth = 6;
    int startAttack = 1;
    int itemCapacity = 2;
};

class Game {
public:
    // Zombie damage taken from a single fight is capped at this.
    static constexpr int MAX_ZOMBIE_DAMAGE = 4;
    static constexpr int BASH_ZOMBIES = 3;
    static constexpr int COWER_HEAL = 3;

    Game(GameContent content, const GameConfig& cfg);

    void setChoiceProvider(ChoiceFn fn) { choose_ = std::move(fn); }

    // The new observer immediately receives every placed room and a snapshot.
    int addObserver(GameObserver obs);
    void removeObserver(int id);

    // Player actions. Each runs to completion (including prompts) before returning.
    ActionResult move(Direction d);
    ActionResult bash(Direction d);
    ActionResult cower();
    ActionResult findOrBuryTotem();

    // Logs and returns the player's details. Takes no time.
    std::string inspect();

    // Applies zombie damage: zombies - attack, capped at MAX_ZOMBIE_DAMAGE, none if negative.
    // Returns the damage taken.
    int fightZombies(int zombies);

    const Board& board() const { return board_; }
    Board& boardMut() { return board_; }
    const Player& player() const { return player_; }
    Player& playerMut() { return player_; }
    const GameContent& content() const { return content_; }

    const Tile& currentRoom() const;

    // Exits of the current room that lead into an explored room.
    std::vector<Direction> escapeDirections() const;

    // True once a move or bash has fully resolved; cleared by cowering.
    bool turnSequenceComplete() const { return turnSequenceComplete_; }

    GameOutcome outcome() const { return outcome_; }
    bool isGameOver() const { return outcome_ == GameOutcome::DiedOfWounds || outcome_ == GameOutcome::OutOfTime; }
    bool isGameWon() const { return outcome_ == GameOutcome::Won; }
    bool isFinished() const { return outcome_ != GameOutcome::InProgress; }
    const std::string& endCause() const { return endCause_; }

    GameSnapshot snapshot() const;

    const std::vector<Message>& messages() const { return msgs; }
    void pushSystemMessage(const std::string& msg);

private:
    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

    Tile& currentRoomMut();

    // Placement of a freshly drawn room at the player's location.
    void placeNewTile(Direction moved, Tile tile, bool resolveAfter);
    void chooseEntry(Direction moved, Tile& tile);
    // False when the companion is gone or its spot is already explored.
    bool placeCompanion(Direction moved, Tile& anchor);

    // Development cards
    void resolveEvent();
    std::optional<EventCard> drawDevCard();
    bool runAwayOrFight(int zombies);
    bool escapeZombies();
    void findItem();
    void applyRoomBonus();
    void gainItem(const std::string& item);
    void loseItem(const std::string& item);

    // Ends the game on death or when the last hour runs out of cards.
    // Advances the clock when the deck is empty. Returns true if the game is over.
    bool checkGameOver();
    void endGame(GameOutcome outcome, const std::string& cause);

    std::string askChoice(ChoiceKind kind, const std::string& prompt,
                          const std::vector<std::string>& options, const std::string& invalidMsg);
    Direction askDirection(ChoiceKind kind, const std::string& prompt,
                           const std::vector<Direction>& dirs, const std::string& invalidMsg);

    bool refuseIfFinished();

    void publishSnapshot();
    void publishTile(Coord pos);

    bool isRoom(const std::string& roomName, const std::vector<std::string>& names) const;

    GameContent content_;
    Board board_;
    Player player_;

    ChoiceFn choose_;
    std::vector<std::pair<int, GameObserver>> observers_;
    int nextObserverId_ = 1;

    bool turnSequenceComplete_ = false;
    bool cowered_ = false;

    GameOutcome outcome_ = GameOutcome::InProgress;
    std::string endCause_;

    std::vector<Message> msgs;
};
