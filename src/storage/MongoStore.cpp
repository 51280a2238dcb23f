#include "MongoStore.hpp"
#include "../shared/Encoding.hpp"

#include <bsoncxx/builder/stream/array.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/stream/helpers.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

#include <chrono>
#include <print>

using namespace WordleChain;
using namespace bsoncxx::builder::stream;

static mongocxx::instance instance{};

static constexpr const char* PUZZLES = "puzzles";
static constexpr int DUPLICATE_KEY = 11000;

class MongoStore::Impl {
public:
    std::shared_ptr<mongocxx::pool> pool;
    std::string dbName;

    Impl(const std::string& uriString, const std::string& name)
        : dbName(name) {
        mongocxx::uri uri{ uriString };
        pool = std::make_shared<mongocxx::pool>(uri);
    }

    auto acquire() {
        return pool->acquire();
    }

    static std::int64_t key(PuzzleId puzzleId) {
        return static_cast<std::int64_t>(puzzleId);
    }

    // Rebuilds a record through the same checked operations the engine uses,
    // so a document that breaks an invariant is refused instead of loaded.
    static std::optional<PuzzleRecord> fromDocument(bsoncxx::document::view view) {
        PuzzleRecord record;

        record.puzzle.id = static_cast<PuzzleId>(view["puzzleId"].get_int64().value);

        auto commitment = digestFromHex(std::string(view["commitment"].get_string().value));
        if (!commitment) {
            std::print("[MONGO] Puzzle {} has a malformed commitment\n", record.puzzle.id);
            return std::nullopt;
        }
        record.puzzle.answer = SealedAnswer(*commitment);

        auto state = puzzleStateFrom(view["state"].get_int32().value);
        if (!state) {
            std::print("[MONGO] Puzzle {} has unknown state {}\n", record.puzzle.id, view["state"].get_int32().value);
            return std::nullopt;
        }
        record.puzzle.state = *state;

        std::string storedAnswer;
        if (view["answer"] && view["answer"].type() == bsoncxx::type::k_string) {
            storedAnswer = std::string(view["answer"].get_string().value);
        }

        if (!storedAnswer.empty()) {
            auto bytes = fromHex(storedAnswer);
            auto word = bytes ? toWord(*bytes) : std::nullopt;
            if (!word || !record.puzzle.answer.unseal(*word)) {
                std::print("[MONGO] Puzzle {} stored answer does not open its commitment\n", record.puzzle.id);
                return std::nullopt;
            }
        }

        if (view["winnerCount"]) record.puzzle.winnerCount = static_cast<std::uint32_t>(view["winnerCount"].get_int64().value);
        if (view["playerCount"]) record.puzzle.playerCount = static_cast<std::uint32_t>(view["playerCount"].get_int64().value);

        if (view["players"] && view["players"].type() == bsoncxx::type::k_array) {
            for (const auto& elem : view["players"].get_array().value) {
                auto doc = elem.get_document().view();
                PlayerId player = std::string(doc["player"].get_string().value);

                if (!record.roster.insertIfAbsent(player)) {
                    std::print("[MONGO] Puzzle {} roster exceeds capacity\n", record.puzzle.id);
                    return std::nullopt;
                }

                if (doc["winner"] && doc["winner"].get_bool().value) {
                    record.winners.insert(player);
                }

                if (!doc["attempts"] || doc["attempts"].type() != bsoncxx::type::k_array) continue;

                for (const auto& attemptElem : doc["attempts"].get_array().value) {
                    auto attemptDoc = attemptElem.get_document().view();

                    auto bytes = fromHex(std::string(attemptDoc["guess"].get_string().value));
                    auto word = bytes ? toWord(*bytes) : std::nullopt;
                    if (!word) {
                        std::print("[MONGO] Puzzle {} has a malformed guess for {}\n", record.puzzle.id, player);
                        return std::nullopt;
                    }

                    auto index = record.ledger.append(player, *word);
                    if (!index) {
                        std::print("[MONGO] Puzzle {}: {}\n", record.puzzle.id, index.error().message);
                        return std::nullopt;
                    }

                    ScoreVector scores;
                    if (attemptDoc["scores"] && attemptDoc["scores"].type() == bsoncxx::type::k_array) {
                        for (const auto& s : attemptDoc["scores"].get_array().value) {
                            auto score = letterScoreFrom(s.get_int32().value);
                            if (!score) {
                                std::print("[MONGO] Puzzle {} has an unknown score for {}\n", record.puzzle.id, player);
                                return std::nullopt;
                            }
                            scores.push_back(*score);
                        }
                    }
                    if (scores.empty()) continue;
                    if (scores.size() != WORD_LENGTH) {
                        std::print("[MONGO] Puzzle {} has {} scores for a guess by {}\n", record.puzzle.id, scores.size(), player);
                        return std::nullopt;
                    }
                    if (!record.ledger.setScores(player, *index, std::move(scores))) {
                        return std::nullopt;
                    }
                }
            }
        }

        if (auto problem = findInconsistency(record)) {
            std::print("[MONGO] Puzzle {} refused: {}\n", record.puzzle.id, *problem);
            return std::nullopt;
        }

        return record;
    }

    static bsoncxx::document::value toDocument(const PuzzleRecord& record) {
        bsoncxx::builder::stream::array players_array;
        for (const auto& player : record.roster.players()) {

            bsoncxx::builder::stream::array attempts_array;
            for (const auto& attempt : record.ledger.attemptsFor(player)) {
                bsoncxx::builder::stream::array scores_array;
                for (LetterScore s : attempt.scores) scores_array << static_cast<std::int32_t>(s);

                attempts_array << open_document
                    << "guess" << toHex(attempt.guess)
                    << "scores" << bsoncxx::types::b_array{ scores_array.view() }
                    << close_document;
            }

            players_array << open_document
                << "player" << player
                << "winner" << record.isWinner(player)
                << "attempts" << bsoncxx::types::b_array{ attempts_array.view() }
                << close_document;
        }

        const auto& answer = record.puzzle.answer.revealed();

        return document{}
            << "puzzleId" << key(record.puzzle.id)
            << "commitment" << toHex(record.puzzle.answer.commitment())
            << "state" << static_cast<std::int32_t>(record.puzzle.state)
            << "answer" << (answer ? toHex(*answer) : std::string())
            << "winnerCount" << static_cast<std::int64_t>(record.puzzle.winnerCount)
            << "playerCount" << static_cast<std::int64_t>(record.puzzle.playerCount)
            << "players" << bsoncxx::types::b_array{ players_array.view() }
            << "updatedAt" << bsoncxx::types::b_date(std::chrono::system_clock::now())
            << finalize;
    }
};

MongoStore::MongoStore(const std::string& connectionUri, const std::string& dbName)
    : pImpl(std::make_unique<Impl>(connectionUri, dbName)) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName][PUZZLES];

        mongocxx::options::index opts;
        opts.unique(true);
        collection.create_index(document{} << "puzzleId" << 1 << finalize, opts);
    }
    catch (const std::exception& e) {
        std::print("[MONGO] Could not ensure puzzleId index: {}\n", e.what());
    }
}

MongoStore::~MongoStore() = default;

bool MongoStore::puzzleExists(PuzzleId puzzleId) const {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName][PUZZLES];
        return collection.count_documents(document{} << "puzzleId" << Impl::key(puzzleId) << finalize) > 0;
    }
    catch (const std::exception& e) {
        std::print("[MONGO] Error in puzzleExists: {}\n", e.what());
        return false;
    }
}

std::optional<PuzzleRecord> MongoStore::getPuzzle(PuzzleId puzzleId) const {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName][PUZZLES];

        auto result = collection.find_one(document{} << "puzzleId" << Impl::key(puzzleId) << finalize);
        if (!result) return std::nullopt;

        return Impl::fromDocument(result->view());
    }
    catch (const std::exception& e) {
        std::print("[MONGO] Error in getPuzzle: {}\n", e.what());
        return std::nullopt;
    }
}

InsertOutcome MongoStore::insertPuzzle(const PuzzleRecord& record) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName][PUZZLES];

        auto result = collection.insert_one(Impl::toDocument(record).view());
        return result ? InsertOutcome::Inserted : InsertOutcome::Failed;
    }
    catch (const mongocxx::operation_exception& e) {
        if (e.code().value() == DUPLICATE_KEY) {
            std::print("[MONGO] Puzzle {} already stored\n", record.puzzle.id);
            return InsertOutcome::Duplicate;
        }
        std::print("[MONGO] Error in insertPuzzle: {}\n", e.what());
        return InsertOutcome::Failed;
    }
    catch (const std::exception& e) {
        std::print("[MONGO] Error in insertPuzzle: {}\n", e.what());
        return InsertOutcome::Failed;
    }
}

bool MongoStore::savePuzzle(const PuzzleRecord& record) {
    try {
        auto conn = pImpl->acquire();
        auto collection = (*conn)[pImpl->dbName][PUZZLES];

        auto result = collection.replace_one(
            document{} << "puzzleId" << Impl::key(record.puzzle.id) << finalize,
            Impl::toDocument(record).view()
        );

        return result && result->matched_count() > 0;
    }
    catch (const std::exception& e) {
        std::print("[MONGO] Error in savePuzzle: {}\n", e.what());
        return false;
    }
}
