#include <gtest/gtest.h>
#include <modelflux/storage/database.h>

#include "../../common/test_helpers.h"

#include <array>
#include <cstddef>

using namespace modelflux;
using namespace modelflux::storage;

namespace {

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:"));
        ASSERT_TRUE(db_.execute("CREATE TABLE parents (id TEXT PRIMARY KEY);"
                                "CREATE TABLE items (id INTEGER PRIMARY KEY, "
                                "parent TEXT REFERENCES parents(id) ON DELETE CASCADE, "
                                "name TEXT, payload BLOB)"));
        ASSERT_TRUE(db_.execute("INSERT INTO parents VALUES ('p')"));
    }

    int64_t count(const std::string& table) {
        auto q = db_.prepare("SELECT COUNT(*) FROM " + table);
        EXPECT_TRUE(q);
        auto row = q.value().step();
        EXPECT_TRUE(row && row.value());
        return q.value().columnInt64(0);
    }

    Database db_;
};

} // namespace

TEST_F(DatabaseTest, BindAndReadBack) {
    auto stmt = db_.prepare("INSERT INTO items (parent, name, payload) VALUES (?, ?, ?)");
    ASSERT_TRUE(stmt);
    std::array<std::byte, 3> blob{std::byte{1}, std::byte{2}, std::byte{3}};
    ASSERT_TRUE(stmt.value().bindAll("p", std::string("alpha"),
                                     std::span<const std::byte>(blob.data(), blob.size())));
    ASSERT_TRUE(stmt.value().execute());
    EXPECT_EQ(db_.changes(), 1);

    auto q = db_.prepare("SELECT name, payload, id FROM items WHERE id = ?");
    ASSERT_TRUE(q);
    auto& sel = q.value();
    ASSERT_TRUE(sel.bind(1, db_.lastInsertRowId()));
    auto row = sel.step();
    ASSERT_TRUE(row);
    ASSERT_TRUE(row.value());
    EXPECT_EQ(sel.columnText(0), "alpha");
    auto bytes = sel.columnBlob(1);
    ASSERT_EQ(bytes.size(), 3u);
    EXPECT_EQ(bytes[2], std::byte{3});
    EXPECT_EQ(sel.columnInt64(2), db_.lastInsertRowId());
    auto done = sel.step();
    ASSERT_TRUE(done);
    EXPECT_FALSE(done.value());
}

TEST_F(DatabaseTest, ExecuteResetsForRebinding) {
    auto stmt = db_.prepare("INSERT INTO items (parent, name) VALUES ('p', ?)");
    ASSERT_TRUE(stmt);
    for (const char* name : {"a", "b", "c"}) {
        ASSERT_TRUE(stmt.value().bind(1, name));
        ASSERT_TRUE(stmt.value().execute());
    }
    EXPECT_EQ(count("items"), 3);
}

TEST_F(DatabaseTest, ForeignKeysAreEnforcedByDefault) {
    auto stmt = db_.prepare("INSERT INTO items (parent, name) VALUES (?, 'orphan')");
    ASSERT_TRUE(stmt);
    ASSERT_TRUE(stmt.value().bind(1, "missing"));
    auto r = stmt.value().execute();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DatabaseError);
    EXPECT_NE(r.error().message.find("[SQL: INSERT INTO items"), std::string::npos);

    ASSERT_TRUE(db_.execute("INSERT INTO items (parent, name) VALUES ('p', 'child')"));
    ASSERT_TRUE(db_.execute("DELETE FROM parents WHERE id = 'p'"));
    EXPECT_EQ(count("items"), 0);
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    auto r = db_.transaction([&]() -> Result<void> {
        auto ins = db_.execute("INSERT INTO items (name) VALUES ('kept?')");
        if (!ins)
            return ins;
        return Error{ErrorCode::InvalidData, "abort"};
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "abort");
    EXPECT_EQ(count("items"), 0);
}

TEST_F(DatabaseTest, TransactionCommitsAndRejectsNesting) {
    auto r = db_.transaction([&]() -> Result<void> {
        auto ins = db_.execute("INSERT INTO items (name) VALUES ('x')");
        if (!ins)
            return ins;
        auto nested = db_.transaction([]() -> Result<void> { return {}; });
        EXPECT_FALSE(nested);
        EXPECT_EQ(nested.error().code, ErrorCode::InvalidState);
        return {};
    });
    ASSERT_TRUE(r);
    EXPECT_EQ(count("items"), 1);
}

TEST_F(DatabaseTest, InvalidSqlIsAnError) {
    auto r = db_.execute("SELEKT 1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DatabaseError);

    auto p = db_.prepare("SELECT nope FROM items");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error().code, ErrorCode::DatabaseError);
}

TEST(DatabaseFileTest, PersistsAcrossConnections) {
    tests::TempDir tmp;
    const auto path = (tmp.path() / "t.db").string();
    {
        Database db;
        ASSERT_TRUE(db.open(path));
        ASSERT_TRUE(db.execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v TEXT)"));
        ASSERT_TRUE(db.execute("INSERT INTO kv VALUES ('a', 'b')"));
        EXPECT_FALSE(db.open(path));
    }
    Database db;
    ASSERT_TRUE(db.open(path));
    auto q = db.prepare("SELECT v FROM kv WHERE k = 'a'");
    ASSERT_TRUE(q);
    auto row = q.value().step();
    ASSERT_TRUE(row);
    ASSERT_TRUE(row.value());
    EXPECT_EQ(q.value().columnText(0), "b");
}

TEST(DatabaseFileTest, OperationsOnClosedDatabaseFail) {
    Database db;
    EXPECT_FALSE(db.isOpen());
    auto r = db.execute("SELECT 1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    EXPECT_FALSE(db.prepare("SELECT 1"));
}
