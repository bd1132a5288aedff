#include <catch2/catch.hpp>
#include "AppException.hpp"
#include "HistoryManager.hpp"
#include "Operation.hpp"

#include <chrono>
#include <string>

namespace {

Operation make_copy(int index)
{
    const std::string source = "/src/file" + std::to_string(index);
    UndoPayload payload;
    payload.entries.push_back(PathPair{source, "/dst/file" + std::to_string(index)});
    return Operation(OperationKind::Copy, {source}, std::string("/dst"), true, payload);
}

Operation make_rename(const std::string& from, const std::string& to, Operation::Clock::time_point when)
{
    UndoPayload payload;
    payload.original_name = from.substr(from.rfind('/') + 1);
    payload.entries.push_back(PathPair{from, to});
    return Operation(OperationKind::Rename, {from}, to, true, payload, when);
}

} // namespace

TEST_CASE("undoable operations need an undo payload") {
    REQUIRE_THROWS_AS(Operation(OperationKind::Copy, {"/a"}, std::string("/b"), true, UndoPayload{}),
                      ErrorCodes::AppException);
    REQUIRE_NOTHROW(Operation(OperationKind::Delete, {"/a"}, std::nullopt, false, UndoPayload{}));
}

TEST_CASE("descriptions are derived from the operation") {
    CHECK(make_copy(1).description() == "Copy 'file1' to '/dst'");

    const Operation del(OperationKind::Delete, {"/a", "/b"}, std::nullopt, false, UndoPayload{});
    CHECK(del.description() == "Delete 2 items");
}

TEST_CASE("non-undoable operations are not recorded") {
    HistoryManager history;
    const Operation permanent(OperationKind::Delete, {"/a"}, std::nullopt, false, UndoPayload{});
    CHECK_FALSE(history.record(permanent));
    CHECK_FALSE(history.can_undo());
}

TEST_CASE("undo and redo move entries between the stacks") {
    HistoryManager history;
    history.record(make_copy(1));
    history.record(make_copy(2));

    auto undone = history.undo();
    REQUIRE(undone);
    CHECK(undone->source_paths().front() == "/src/file2");
    CHECK(history.undo_size() == 1);
    CHECK(history.redo_size() == 1);
    CHECK(history.peek_redo()->description() == undone->description());

    auto redone = history.redo();
    REQUIRE(redone);
    CHECK(redone->description() == undone->description());
    CHECK(history.undo_size() == 2);
    CHECK(history.redo_size() == 0);
}

TEST_CASE("recording clears the redo stack") {
    HistoryManager history;
    history.record(make_copy(1));
    history.record(make_copy(2));
    history.undo();
    history.undo();
    REQUIRE(history.redo_size() == 2);

    history.record(make_copy(3));
    CHECK(history.redo_size() == 0);
    CHECK_FALSE(history.redo());
}

TEST_CASE("empty stacks report nothing to undo or redo") {
    HistoryManager history;
    CHECK_FALSE(history.undo());
    CHECK_FALSE(history.redo());
    CHECK_FALSE(history.peek_undo());
    CHECK_FALSE(history.peek_redo());
}

TEST_CASE("oldest entries are evicted past max_size") {
    HistoryManager history(HistoryConfig{100, false, std::chrono::milliseconds(1000)});
    for (int i = 0; i < 101; ++i) {
        history.record(make_copy(i));
    }
    REQUIRE(history.undo_size() == 100);
    CHECK(history.undo_history().front().source_paths().front() == "/src/file1");

    int undone = 0;
    while (history.undo()) {
        ++undone;
    }
    CHECK(undone == 100);
    CHECK_FALSE(history.undo());
    CHECK(history.redo_size() == 100);
}

TEST_CASE("redo stack is never pruned by size") {
    HistoryManager history(HistoryConfig{3, false, std::chrono::milliseconds(1000)});
    for (int i = 0; i < 3; ++i) {
        history.record(make_copy(i));
    }
    while (history.undo()) {
    }
    CHECK(history.redo_size() == 3);
}

TEST_CASE("rapid renames of the same item merge into one entry") {
    HistoryManager history(HistoryConfig{100, true, std::chrono::milliseconds(1000)});
    const auto start = Operation::Clock::now();
    history.record(make_rename("/d/a.txt", "/d/b.txt", start));
    history.record(make_rename("/d/b.txt", "/d/c.txt", start + std::chrono::milliseconds(200)));

    REQUIRE(history.undo_size() == 1);
    const auto merged = history.peek_undo();
    REQUIRE(merged);
    CHECK(merged->undo_payload().entries.front() == PathPair{"/d/a.txt", "/d/c.txt"});
    CHECK(merged->undo_payload().original_name == "a.txt");
}

TEST_CASE("renames outside the merge window stay separate") {
    HistoryManager history(HistoryConfig{100, true, std::chrono::milliseconds(1000)});
    const auto start = Operation::Clock::now();
    history.record(make_rename("/d/a.txt", "/d/b.txt", start));
    history.record(make_rename("/d/b.txt", "/d/c.txt", start + std::chrono::seconds(5)));
    CHECK(history.undo_size() == 2);
}

TEST_CASE("renaming back to the original name cancels the entry") {
    HistoryManager history(HistoryConfig{100, true, std::chrono::milliseconds(1000)});
    const auto start = Operation::Clock::now();
    history.record(make_copy(1));
    history.record(make_rename("/d/a.txt", "/d/b.txt", start));
    history.record(make_rename("/d/b.txt", "/d/a.txt", start + std::chrono::milliseconds(10)));

    REQUIRE(history.undo_size() == 1);
    CHECK(history.peek_undo()->kind() == OperationKind::Copy);
}

TEST_CASE("merging stays off unless enabled") {
    HistoryManager history;
    const auto start = Operation::Clock::now();
    history.record(make_rename("/d/a.txt", "/d/b.txt", start));
    history.record(make_rename("/d/b.txt", "/d/c.txt", start));
    CHECK(history.undo_size() == 2);
}

TEST_CASE("discarding an entry drops it from both stacks") {
    HistoryManager history;
    history.record(make_copy(1));
    history.record(make_copy(2));

    const auto dropped = history.discard_next_undo();
    REQUIRE(dropped);
    CHECK(history.undo_size() == 1);
    CHECK(history.redo_size() == 0);
}

TEST_CASE("recent descriptions list the newest entries oldest first") {
    HistoryManager history;
    for (int i = 0; i < 5; ++i) {
        history.record(make_copy(i));
    }
    const auto recent = history.recent_descriptions(2);
    REQUIRE(recent.size() == 2);
    CHECK(recent[0] == "Copy 'file3' to '/dst'");
    CHECK(recent[1] == "Copy 'file4' to '/dst'");

    history.clear();
    CHECK(history.recent_descriptions(10).empty());
}
