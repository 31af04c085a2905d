#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include "roomsync/sync/delta.h"
#include "roomsync/sync/document_store.h"
#include "roomsync/sync/replicated_document.h"
#include "roomsync/sync/snapshot_store.h"

using namespace roomsync;

namespace {

// Captures every delta a document emits for local writes
struct DeltaRecorder {
    std::vector<Bytes> deltas;

    explicit DeltaRecorder(ReplicatedDocument& doc) {
        doc.on_update([this](const Bytes& delta) { deltas.push_back(delta); });
    }
};

std::filesystem::path temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

} // anonymous namespace

TEST_CASE("Local Writes Are Visible And Emitted", "[sync][document]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    DeltaRecorder recorder(*doc);

    doc->set("files", "a", {{"name", "a.txt"}});
    doc->set("files", "b", 42);
    REQUIRE(doc->size("files") == 2);
    REQUIRE(doc->get("files", "b") == nlohmann::json(42));
    REQUIRE(doc->contains("files", "a"));
    REQUIRE(doc->keys("files") == std::vector<std::string>{"a", "b"});
    REQUIRE(recorder.deltas.size() == 2);

    REQUIRE(doc->erase("files", "a"));
    REQUIRE_FALSE(doc->contains("files", "a"));
    REQUIRE_FALSE(doc->erase("files", "missing"));
    REQUIRE(recorder.deltas.size() == 3);

    REQUIRE(doc->clear("files") == 1);
    REQUIRE(doc->size("files") == 0);
}

TEST_CASE("Merge Is Idempotent", "[sync][merge]") {
    auto writer = std::make_shared<ReplicatedDocument>("room", 1);
    DeltaRecorder recorder(*writer);
    writer->set("files", "x", "first");
    writer->set("files", "y", "second");
    writer->erase("files", "x");

    auto once = std::make_shared<ReplicatedDocument>("room", 2);
    auto twice = std::make_shared<ReplicatedDocument>("room", 3);
    for (const auto& delta : recorder.deltas) {
        REQUIRE(once->apply_update(delta).ok());
        REQUIRE(twice->apply_update(delta).ok());
        REQUIRE(twice->apply_update(delta).ok());
    }

    REQUIRE(once->entries("files") == twice->entries("files"));
    REQUIRE(once->encode_state_as_update() == twice->encode_state_as_update());
    REQUIRE_FALSE(twice->contains("files", "x"));
}

TEST_CASE("Merge Order Does Not Matter", "[sync][merge]") {
    auto peer_a = std::make_shared<ReplicatedDocument>("room", 10);
    auto peer_b = std::make_shared<ReplicatedDocument>("room", 20);
    DeltaRecorder from_a(*peer_a);
    DeltaRecorder from_b(*peer_b);

    // Concurrent writes to the same key and to distinct keys
    peer_a->set("files", "shared", "from-a");
    peer_a->set("files", "only-a", 1);
    peer_b->set("files", "shared", "from-b");
    peer_b->set("chunks", "only-b", 2);

    auto ab = std::make_shared<ReplicatedDocument>("room", 30);
    auto ba = std::make_shared<ReplicatedDocument>("room", 40);
    for (const auto& d : from_a.deltas) ab->apply_update(d);
    for (const auto& d : from_b.deltas) ab->apply_update(d);
    for (const auto& d : from_b.deltas) ba->apply_update(d);
    for (const auto& d : from_a.deltas) ba->apply_update(d);

    REQUIRE(ab->entries("files") == ba->entries("files"));
    REQUIRE(ab->entries("chunks") == ba->entries("chunks"));
    REQUIRE(ab->encode_state_as_update() == ba->encode_state_as_update());

    // Both writers converge too once they exchange deltas
    for (const auto& d : from_b.deltas) peer_a->apply_update(d);
    for (const auto& d : from_a.deltas) peer_b->apply_update(d);
    REQUIRE(peer_a->get("files", "shared") == peer_b->get("files", "shared"));
}

TEST_CASE("Tombstones Win Over Older Writes", "[sync][merge]") {
    auto writer = std::make_shared<ReplicatedDocument>("room", 1);
    DeltaRecorder recorder(*writer);
    writer->set("files", "k", "v");
    writer->erase("files", "k");

    auto reader = std::make_shared<ReplicatedDocument>("room", 2);
    // Delete arrives before the write it supersedes
    reader->apply_update(recorder.deltas[1]);
    reader->apply_update(recorder.deltas[0]);
    REQUIRE_FALSE(reader->contains("files", "k"));
}

TEST_CASE("Malformed Deltas Are Dropped", "[sync][delta]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    doc->set("files", "keep", "me");
    auto before = doc->encode_state_as_update();

    for (const Bytes& junk : {Bytes{}, Bytes{0x00}, Bytes{0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFF},
                              Bytes{0x42, 0x01, 0x00, 0x00, 0x00, 0x00}}) {
        auto status = doc->apply_update(junk);
        REQUIRE_FALSE(status.ok());
        REQUIRE(status.error().code == ErrorCode::MalformedDelta);
    }
    REQUIRE(doc->encode_state_as_update() == before);
    REQUIRE(doc->get("files", "keep") == nlohmann::json("me"));
}

TEST_CASE("Delta Codec Preserves Entries", "[sync][delta]") {
    std::vector<DeltaEntry> entries = {
        {"files", "a", {5, 9}, nlohmann::json{{"size", 10}}},
        {"files", "b", {6, 9}, std::nullopt},
        {"chunks", "a-0", {7, 9}, nlohmann::json("ZGF0YQ==")},
    };
    auto encoded = encode_delta(entries);
    REQUIRE(encoded[0] == DELTA_MARKER);

    auto decoded = decode_delta(encoded);
    REQUIRE(decoded.ok());
    REQUIRE(decoded->size() == 3);

    bool saw_tombstone = false;
    for (const auto& entry : *decoded) {
        if (entry.key == "b") {
            REQUIRE(entry.is_tombstone());
            REQUIRE(entry.version == EntryVersion{6, 9});
            saw_tombstone = true;
        }
    }
    REQUIRE(saw_tombstone);
}

TEST_CASE("Observers See Local And Remote Changes", "[sync][observe]") {
    auto writer = std::make_shared<ReplicatedDocument>("room", 1);
    DeltaRecorder recorder(*writer);
    auto reader = std::make_shared<ReplicatedDocument>("room", 2);

    std::vector<MapChangeEvent> events;
    auto subscription = reader->observe("files", [&](const MapChangeEvent& e) { events.push_back(e); });

    writer->set("files", "a", 1);
    writer->set("other", "z", 1);
    for (const auto& d : recorder.deltas) reader->apply_update(d);

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].origin == ChangeOrigin::Remote);
    REQUIRE(events[0].keys == std::vector<std::string>{"a"});

    reader->set("files", "b", 2);
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].origin == ChangeOrigin::Local);

    reader->unobserve(subscription);
    reader->set("files", "c", 3);
    REQUIRE(events.size() == 2);
}

TEST_CASE("Unobserve Waits For A Running Observer", "[sync][observe]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    std::atomic<int> calls{0};

    auto subscription = doc->observe("files", [&](const MapChangeEvent&) {
        calls++;
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
    });

    std::thread writer([&] { doc->set("files", "a", 1); });
    while (!entered) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    doc->unobserve(subscription);
    REQUIRE(finished);

    doc->set("files", "b", 2);
    writer.join();
    REQUIRE(calls == 1);
}

TEST_CASE("Observer May Remove Itself", "[sync][observe]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    uint64_t subscription = 0;
    int calls = 0;
    subscription = doc->observe("files", [&](const MapChangeEvent&) {
        calls++;
        doc->unobserve(subscription);
    });

    doc->set("files", "a", 1);
    doc->set("files", "b", 2);
    REQUIRE(calls == 1);

    uint64_t listener = 0;
    int updates = 0;
    listener = doc->on_update([&](const Bytes&) {
        updates++;
        doc->remove_update_listener(listener);
    });
    doc->set("files", "c", 3);
    doc->set("files", "d", 4);
    REQUIRE(updates == 1);
}

TEST_CASE("Late Observer Gets Synthetic Snapshot Event", "[sync][observe][snapshot]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    doc->set("files", "a", 1);

    int before_load = 0;
    doc->observe("files", [&](const MapChangeEvent&) { before_load++; });
    REQUIRE(before_load == 0);

    doc->mark_snapshot_loaded();
    REQUIRE(doc->snapshot_loaded());

    std::vector<MapChangeEvent> events;
    doc->observe("files", [&](const MapChangeEvent& e) { events.push_back(e); });
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].origin == ChangeOrigin::Snapshot);
    REQUIRE(events[0].keys == std::vector<std::string>{"a"});
}

TEST_CASE("State Splits Into Bounded Batches", "[sync][document]") {
    auto doc = std::make_shared<ReplicatedDocument>("room", 1);
    std::string blob(10000, 'x');
    for (int i = 0; i < 50; ++i) {
        doc->set("chunks", "c" + std::to_string(i), blob);
    }

    auto batches = doc->encode_state_as_updates(64 * 1024);
    REQUIRE(batches.size() > 1);

    auto copy = std::make_shared<ReplicatedDocument>("room", 2);
    for (const auto& batch : batches) {
        REQUIRE(copy->apply_update(batch).ok());
    }
    REQUIRE(copy->size("chunks") == 50);
    REQUIRE(copy->encode_state_as_update() == doc->encode_state_as_update());
}

TEST_CASE("Replicated Map Handle", "[sync][map]") {
    DocumentStore store;
    auto map = store.get_map("room-1", SHARED_FILES_NAMESPACE);
    REQUIRE(map.ok());
    REQUIRE(map->name() == SHARED_FILES_NAMESPACE);

    map->set("id", {{"name", "x"}});
    REQUIRE(map->size() == 1);
    REQUIRE((*store.get_document("room-1"))->contains(SHARED_FILES_NAMESPACE, "id"));
}

TEST_CASE("Document Store Ids", "[sync][store]") {
    REQUIRE(DocumentStore::is_valid_document_id("room-1"));
    REQUIRE(DocumentStore::is_valid_document_id("team/room_2.v1"));
    REQUIRE_FALSE(DocumentStore::is_valid_document_id(""));
    REQUIRE_FALSE(DocumentStore::is_valid_document_id("bad id"));

    DocumentStore store;
    REQUIRE(store.get_document("bad id").error().code == ErrorCode::InvalidArgument);

    auto first = store.get_document("room-1");
    auto second = store.get_document("room-1");
    REQUIRE(*first == *second);
    REQUIRE(store.has_document("room-1"));
    REQUIRE(store.remove_document("room-1"));
    REQUIRE_FALSE(store.has_document("room-1"));
}

TEST_CASE("Document Store Merge And Export", "[sync][store]") {
    DocumentStore store;
    (*store.get_document("a"))->set("files", "x", 1);
    (*store.get_document("b"))->set("files", "y", 2);

    REQUIRE(store.merge_documents("a", "b").ok());
    REQUIRE((*store.get_document("a"))->size("files") == 2);
    REQUIRE(store.merge_documents("a", "missing").error().code == ErrorCode::NotFound);

    auto state = store.export_state("a");
    REQUIRE(state.ok());
    REQUIRE(store.import_state("c", *state).ok());
    REQUIRE((*store.get_document("c"))->size("files") == 2);
}

TEST_CASE("Snapshots Persist Document State", "[sync][snapshot]") {
    auto dir = temp_dir("roomsync_snapshots");
    {
        DocumentStore store(std::make_shared<FileSnapshotStore>(dir.string()));
        (*store.get_document("room-1"))->set("files", "a", "persisted");
        REQUIRE(store.save_snapshot("room-1").ok());
    }

    DocumentStore restored(std::make_shared<FileSnapshotStore>(dir.string()));
    REQUIRE(restored.load_snapshot("room-1").ok());
    auto doc = *restored.get_document("room-1");
    REQUIRE(doc->get("files", "a") == nlohmann::json("persisted"));
    REQUIRE(doc->snapshot_loaded());

    REQUIRE(restored.load_snapshot("room-2").error().code == ErrorCode::NotFound);

    DocumentStore no_persistence;
    REQUIRE(no_persistence.save_snapshot("room-1").error().code == ErrorCode::SnapshotFailed);

    std::filesystem::remove_all(dir);
}
