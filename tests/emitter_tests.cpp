/**
 * @file emitter_tests.cpp
 * @brief Per-move record emission, orientation and all-or-nothing acceptance
 */

#include "test_helpers.hpp"
#include "board.hpp"
#include "emitter.hpp"
#include "move.hpp"
#include <gtest/gtest.h>

using namespace fenrom;

// ============================================================================
// Naming
// ============================================================================

TEST(RecordNameTests, Format) {
    Puzzle puzzle = makePuzzle("00sHx", TestBoards::START_FEN, {"e2e4"}, 1760);
    EXPECT_EQ(recordName(puzzle, "mate", 3), "puzzle-00sHx-1760-mate-03.txt");
    EXPECT_EQ(recordName(puzzle, "none", 12), "puzzle-00sHx-1760-none-12.txt");
}

TEST(RecordNameTests, GroupKeyDropsMoveNumber) {
    EXPECT_EQ(groupKey("puzzle-00sHx-1760-mate-03.txt"), "puzzle-00sHx-1760-mate");
    EXPECT_EQ(groupKey("nohyphen.txt"), "nohyphen.txt");
}

TEST(MoveRecordTests, TextLayout) {
    MoveRecord record{"abc", std::string(64, '1'), "52,36", 1, 4};
    EXPECT_EQ(record.text(), "abc," + std::string(64, '1') + ",52,36,1,4");
}

// ============================================================================
// Emission
// ============================================================================

class PuzzleEmitterTest : public ::testing::Test {
protected:
    Config config;
    MemorySink sink;

    void SetUp() override {
        config.themeTag = "mate";
    }
};

TEST_F(PuzzleEmitterTest, WhiteToMoveIsShownMirrored) {
    Puzzle puzzle = makePuzzle("w1", TestBoards::START_FEN, {"e2e4", "e7e5"});
    PuzzleEmitter emitter(config, &sink);

    EmitResult result = emitter.emit(puzzle);
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.records, 2u);
    EXPECT_EQ(result.lastMovedPiece, 'p');
    ASSERT_EQ(sink.size(), 2u);

    const std::string expectedBoard =
        "RNBKQBNR" "PPP1PPPP" "11111111" "111P1111" "11111111" "11111111" "pppppppp" "rnbkqbnr";
    EXPECT_EQ(sink.read("puzzle-w1-1500-mate-01.txt"), "w1," + expectedBoard + ",11,27,1,2");

    // e7e5 reflected: e7 (12) -> 51, e5 (28) -> 35
    const std::string second = sink.read("puzzle-w1-1500-mate-02.txt");
    ASSERT_GE(second.size(), 10u);
    EXPECT_EQ(second.substr(second.size() - 10), ",51,35,2,2");
}

TEST_F(PuzzleEmitterTest, BlackToMoveIsShownAsIs) {
    Puzzle puzzle = makePuzzle("b1", "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1",
                               {"e7e5", "g1f3"});
    PuzzleEmitter emitter(config, &sink);

    EmitResult result = emitter.emit(puzzle);
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.lastMovedPiece, 'N');

    std::string board = applyMove(puzzle.board(), parseMove("e7e5")).board;
    EXPECT_EQ(sink.read("puzzle-b1-1500-mate-01.txt"), "b1," + expandBoard(board) + ",12,28,1,2");
    board = applyMove(board, parseMove("g1f3")).board;
    EXPECT_EQ(sink.read("puzzle-b1-1500-mate-02.txt"), "b1," + expandBoard(board) + ",62,45,2,2");
}

TEST_F(PuzzleEmitterTest, RecordsFollowEachOtherInMoveOrder) {
    Puzzle puzzle = makePuzzle("seq", TestBoards::START_FEN, {"e2e4", "e7e5", "g1f3", "b8c6"});
    PuzzleEmitter emitter(config, nullptr);

    char lastPiece = ' ';
    auto records = emitter.buildRecords(puzzle, lastPiece);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(lastPiece, 'n');

    std::string board = puzzle.board();
    for (size_t i = 0; i < records.size(); ++i) {
        board = applyMove(board, parseMove(puzzle.moves[i])).board;
        EXPECT_EQ(records[i].moveNumber, i + 1);
        EXPECT_EQ(records[i].totalMoves, 4u);
        EXPECT_EQ(records[i].board, expandBoard(mirrorBoard(board)));
        EXPECT_EQ(records[i].moveIndex, indexMove(puzzle.moves[i], true));
        EXPECT_EQ(records[i].board.size(), BOARD_SQUARES);
    }
}

TEST_F(PuzzleEmitterTest, PromotionRecordsPromotedPieceButReportsPawn) {
    Puzzle puzzle = makePuzzle("promo", "8/P7/8/8/8/8/8/k6K b - - 0 1", {"a1b1", "a7a8q"});
    PuzzleEmitter emitter(config, &sink);

    EmitResult result = emitter.emit(puzzle);
    ASSERT_TRUE(result.accepted);
    EXPECT_EQ(result.lastMovedPiece, 'P');
    const std::string last = sink.read("puzzle-promo-1500-mate-02.txt");
    EXPECT_EQ(last.substr(0, 6 + 8), "promo,Q1111111");
}

// ============================================================================
// Rejection and atomicity
// ============================================================================

TEST_F(PuzzleEmitterTest, TrailingPieceRuleRemovesWholePuzzle) {
    config.lastMovePieces = "q";
    Puzzle puzzle = makePuzzle("pawnEnd", TestBoards::START_FEN, {"e2e4", "e7e5", "d2d4"});
    PuzzleEmitter emitter(config, &sink);

    EmitResult result = emitter.emit(puzzle);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.records, 0u);
    EXPECT_EQ(result.lastMovedPiece, 'P');
    EXPECT_EQ(sink.size(), 0u);
}

TEST_F(PuzzleEmitterTest, TrailingPieceRuleLeavesOtherPuzzlesAlone) {
    config.lastMovePieces = "n";
    PuzzleEmitter emitter(config, &sink);

    EXPECT_TRUE(emitter.emit(makePuzzle("keep", TestBoards::START_FEN, {"e2e4", "g8f6"})).accepted);
    EXPECT_FALSE(emitter.emit(makePuzzle("drop", TestBoards::START_FEN, {"g1f3", "e7e5"})).accepted);

    EXPECT_EQ(sink.list(), (std::vector<std::string>{"puzzle-keep-1500-mate-01.txt",
                                                     "puzzle-keep-1500-mate-02.txt"}));
}

TEST_F(PuzzleEmitterTest, LastMovePieceMatchIsCaseInsensitive) {
    config.lastMovePieces = "p";
    PuzzleEmitter emitter(config, &sink);
    EXPECT_TRUE(emitter.emit(makePuzzle("white", TestBoards::START_FEN, {"e2e4"})).accepted);
}

TEST_F(PuzzleEmitterTest, BadMoveLeavesNothingBehind) {
    Puzzle puzzle = makePuzzle("bad", TestBoards::START_FEN, {"e2e4", "e7e5", "zz99"});
    PuzzleEmitter emitter(config, &sink);

    EXPECT_THROW(emitter.emit(puzzle), MoveError);
    EXPECT_EQ(sink.size(), 0u);
}

TEST_F(PuzzleEmitterTest, ShortBoardFailsWithOutOfBounds) {
    Puzzle puzzle = makePuzzle("short", "8/8/8 w - - 0 1", {"a8a7", "a1a2"});
    PuzzleEmitter emitter(config, &sink);

    EXPECT_THROW(emitter.emit(puzzle), BoardError);
    EXPECT_EQ(sink.size(), 0u);
}

TEST_F(PuzzleEmitterTest, WriteFailureRollsBackWrittenRecords) {
    FailingSink failing(2);
    PuzzleEmitter emitter(config, &failing);
    Puzzle puzzle = makePuzzle("io", TestBoards::START_FEN, {"e2e4", "e7e5", "g1f3"});

    EXPECT_THROW(emitter.emit(puzzle), IoError);
    EXPECT_EQ(failing.size(), 0u);
}

TEST_F(PuzzleEmitterTest, RollbackContinuesPastStuckRecord) {
    FailingSink failing(2, "puzzle-io-1500-mate-01.txt");
    PuzzleEmitter emitter(config, &failing);
    Puzzle puzzle = makePuzzle("io", TestBoards::START_FEN, {"e2e4", "e7e5", "g1f3"});

    try {
        emitter.emit(puzzle);
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("disk full writing puzzle-io-1500-mate-03.txt"), std::string::npos) << message;
        EXPECT_NE(message.find("puzzle-io-1500-mate-01.txt"), std::string::npos) << message;
    }
    EXPECT_TRUE(failing.contains("puzzle-io-1500-mate-01.txt"));
    EXPECT_FALSE(failing.contains("puzzle-io-1500-mate-02.txt"));
    EXPECT_EQ(failing.size(), 1u);
}

TEST_F(PuzzleEmitterTest, PuzzleLargerThanPagesLeftIsNotPersisted) {
    PuzzleEmitter emitter(config, &sink);
    EmitResult result = emitter.emit(makePuzzle("big", TestBoards::START_FEN, {"e2e4", "e7e5", "g1f3"}), 2);
    EXPECT_FALSE(result.accepted);
    EXPECT_TRUE(result.outOfRoom);
    EXPECT_EQ(sink.size(), 0u);

    result = emitter.emit(makePuzzle("fits", TestBoards::START_FEN, {"e2e4", "e7e5"}), 2);
    EXPECT_TRUE(result.accepted);
    EXPECT_FALSE(result.outOfRoom);
    EXPECT_EQ(sink.size(), 2u);
}

TEST_F(PuzzleEmitterTest, RejectedPuzzleIsNotOutOfRoom) {
    config.lastMovePieces = "p";
    PuzzleEmitter emitter(config, &sink);
    EmitResult result = emitter.emit(makePuzzle("knight", TestBoards::START_FEN, {"g1f3", "g8f6"}), 0);
    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.outOfRoom);
    EXPECT_EQ(result.lastMovedPiece, 'n');
}

TEST_F(PuzzleEmitterTest, DryRunCountsWithoutSink) {
    PuzzleEmitter emitter(config, nullptr);
    EmitResult result = emitter.emit(makePuzzle("dry", TestBoards::START_FEN, {"e2e4", "e7e5"}));
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.records, 2u);
}

TEST_F(PuzzleEmitterTest, NoThemeTagNamesRecordsNone) {
    config.themeTag.reset();
    PuzzleEmitter emitter(config, &sink);
    emitter.emit(makePuzzle("plain", TestBoards::START_FEN, {"e2e4"}));
    EXPECT_TRUE(sink.contains("puzzle-plain-1500-none-01.txt"));
}
