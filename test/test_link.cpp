#include <catch2/catch_test_macros.hpp>
#include <string>
#include "roomsync/p2p/room_link.h"

using namespace roomsync;

TEST_CASE("Generate Room Link", "[link][generate]") {
    REQUIRE(generate_room_link("room-42") == "roomsync://join/room-42");
    REQUIRE(generate_room_link("room-42", std::string("s3cret")) == "roomsync://join/room-42?p=s3cret");
    REQUIRE(generate_room_link("room-42", std::string("a b&c")) == "roomsync://join/room-42?p=a%20b%26c");
    // An empty password is not embedded
    REQUIRE(generate_room_link("room-42", std::string("")) == "roomsync://join/room-42");
}

TEST_CASE("Parse Generated Links", "[link][parse]") {
    auto link = parse_room_link(generate_room_link("team.alpha_1", std::string("p@ss word")));
    REQUIRE(link.ok());
    REQUIRE(link->room_id == "team.alpha_1");
    REQUIRE(link->password.has_value());
    REQUIRE(*link->password == "p@ss word");
    REQUIRE_FALSE(link->name.has_value());

    auto plain = parse_room_link("roomsync://join/room-42");
    REQUIRE(plain.ok());
    REQUIRE(plain->room_id == "room-42");
    REQUIRE_FALSE(plain->password.has_value());
}

TEST_CASE("Parse Link Variants", "[link][parse]") {
    SECTION("Bare room code") {
        auto link = parse_room_link("  room-42 \n");
        REQUIRE(link.ok());
        REQUIRE(link->room_id == "room-42");
    }

    SECTION("Scheme is case insensitive") {
        auto link = parse_room_link("RoomSync://join/room-42");
        REQUIRE(link.ok());
        REQUIRE(link->room_id == "room-42");
    }

    SECTION("Older room path and trailing slash") {
        auto link = parse_room_link("roomsync://room/room-42/?n=Design%20Review");
        REQUIRE(link.ok());
        REQUIRE(link->room_id == "room-42");
        REQUIRE(link->name.has_value());
        REQUIRE(*link->name == "Design Review");
    }

    SECTION("Fragment password wins over query") {
        auto link = parse_room_link("roomsync://join/room-42?p=query#p=fragment");
        REQUIRE(link.ok());
        REQUIRE(*link->password == "fragment");
    }
}

TEST_CASE("Reject Invalid Links", "[link][parse]") {
    for (const char* text : {"", "   ", "https://join/room-42", "http://example.com/room-42",
                             "roomsync://join/", "roomsync://invite/room-42", "room 42",
                             "roomsync://join/bad%20id"}) {
        INFO("Input: " << text);
        auto link = parse_room_link(text);
        REQUIRE_FALSE(link.ok());
        REQUIRE(link.error().code == ErrorCode::InvalidLink);
    }
}

TEST_CASE("Room Code Validation", "[link][code]") {
    REQUIRE(is_valid_room_code("abc"));
    REQUIRE(is_valid_room_code("A-b_c.9"));
    REQUIRE_FALSE(is_valid_room_code(""));
    REQUIRE_FALSE(is_valid_room_code("a/b"));
    REQUIRE_FALSE(is_valid_room_code("a b"));
}
