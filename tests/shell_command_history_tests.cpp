#include "tabula/shell/command_history.hpp"

#include <catch2/catch_test_macros.hpp>

using tabula::shell::CommandHistory;

TEST_CASE("CommandHistory terminates stored commands", "[shell][history]")
{
    CommandHistory history;
    history.add("SELECT * FROM t");
    history.add("  DROP TABLE t;  ");
    history.add("exit");

    REQUIRE(history.size() == 3U);
    CHECK(history.entries()[0] == "SELECT * FROM t;");
    CHECK(history.entries()[1] == "DROP TABLE t;");
    CHECK(history.entries()[2] == "exit");
}

TEST_CASE("CommandHistory skips blank, history and recall input", "[shell][history]")
{
    CommandHistory history;
    history.add("   ");
    history.add("HISTORY");
    history.add("history;");
    history.add("!!");
    history.add("!3");
    CHECK(history.empty());
}

TEST_CASE("CommandHistory collapses consecutive duplicates", "[shell][history]")
{
    CommandHistory history;
    history.add("SELECT 1");
    history.add("SELECT 1;");
    history.add("SELECT 2");
    history.add("SELECT 1");
    CHECK(history.size() == 3U);
}

TEST_CASE("CommandHistory evicts the oldest entry when full", "[shell][history]")
{
    CommandHistory history{2U};
    history.add("a");
    history.add("b");
    history.add("c");

    REQUIRE(history.size() == 2U);
    CHECK(history.entries().front() == "b;");
    CHECK(history.capacity() == 2U);

    CommandHistory minimal{0U};
    CHECK(minimal.capacity() == 1U);
}

TEST_CASE("CommandHistory resolves recall commands", "[shell][history]")
{
    CommandHistory history;
    CHECK_FALSE(history.resolve_recall("!!").has_value());

    history.add("SELECT 1");
    history.add("SELECT 2");

    CHECK(CommandHistory::is_recall_command("!!"));
    CHECK(CommandHistory::is_recall_command(" !12 "));
    CHECK_FALSE(CommandHistory::is_recall_command("!x"));
    CHECK_FALSE(CommandHistory::is_recall_command("!"));

    CHECK(history.resolve_recall("!!") == "SELECT 2;");
    CHECK(history.resolve_recall("!1") == "SELECT 1;");
    CHECK_FALSE(history.resolve_recall("!0").has_value());
    CHECK_FALSE(history.resolve_recall("!3").has_value());
    CHECK(history.command_at(1U) == "SELECT 2;");
}

TEST_CASE("CommandHistory browses with a cursor", "[shell][history]")
{
    CommandHistory history;
    history.add("a");
    history.add("b");

    CHECK_FALSE(history.next().has_value());
    CHECK(history.previous() == "b;");
    CHECK(history.previous() == "a;");
    CHECK_FALSE(history.previous().has_value());
    CHECK(history.next() == "b;");
    CHECK_FALSE(history.next().has_value());
    CHECK(history.previous() == "b;");

    history.clear();
    CHECK(history.empty());
    CHECK_FALSE(history.previous().has_value());
}

TEST_CASE("CommandHistory next moves away from the entry previous returned", "[shell][history]")
{
    CommandHistory history;
    history.add("SELECT 1");
    history.add("SELECT 2");
    history.add("SELECT 3");

    CHECK(history.previous() == "SELECT 3;");
    CHECK(history.previous() == "SELECT 2;");
    CHECK(history.next() == "SELECT 3;");
    CHECK(history.previous() == "SELECT 2;");
    CHECK(history.previous() == "SELECT 1;");
    CHECK(history.next() == "SELECT 2;");

    history.add("SELECT 4");
    CHECK(history.previous() == "SELECT 4;");
}
