#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/server/chunk_receiver.hpp"
#include "chunkvault/server/chunk_staging.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/finalizer.hpp"
#include "chunkvault/server/object_store.hpp"
#include "chunkvault/server/session_state.hpp"
#include "chunkvault/server/session_store.hpp"
#include "chunkvault/server/token_store.hpp"

#include "test_support.hpp"

using namespace chunkvault;
using namespace chunkvault::server;
using chunkvault::testing::capture_protocol_error;
using chunkvault::testing::cleanup_path;
using chunkvault::testing::filled;
using chunkvault::testing::fresh_directory;

namespace
{

    const Identity kAlice{"alice", "alice"};
    const Identity kBob{"bob", "bob"};

    struct Harness
    {
        explicit Harness(const std::string &name, SessionPolicy policy = {})
            : root(fresh_directory(name)),
              staging(root / "staging"),
              sessions(std::move(policy), staging),
              finalizer(staging, objects),
              receiver(sessions, staging, finalizer) {}

        ~Harness() { cleanup_path(root); }

        std::filesystem::path root;
        ChunkStaging staging;
        testing::MemoryObjectStore objects;
        SessionStore sessions;
        Finalizer finalizer;
        ChunkReceiver receiver;
    };

    void test_transition_table()
    {
        assert(transition(UploadState::Initialized, SessionEvent::ChunkReceived) == UploadState::Uploading);
        assert(transition(UploadState::Paused, SessionEvent::ChunkReceived) == UploadState::Uploading);
        assert(transition(UploadState::Paused, SessionEvent::Pause) == UploadState::Paused);
        assert(transition(UploadState::Uploading, SessionEvent::Resume) == UploadState::Uploading);
        assert(!transition(UploadState::Initialized, SessionEvent::Resume));
        assert(transition(UploadState::Uploading, SessionEvent::FinalizeSucceeded) == UploadState::Complete);

        for (const auto event : {SessionEvent::ChunkReceived, SessionEvent::Pause, SessionEvent::Resume,
                                 SessionEvent::Cancel, SessionEvent::FinalizeSucceeded})
        {
            assert(!transition(UploadState::Complete, event));
            assert(!transition(UploadState::Cancelled, event));
        }

        assert(is_terminal(UploadState::Complete));
        assert(!is_terminal(UploadState::Paused));
        assert(to_string(UploadState::Complete) == "completed");
        assert(to_string(UploadState::Initialized) == "initialized");
    }

    void test_upload_session_tracking()
    {
        UploadSession session("alice_1", kAlice, "a.mp4", ".mp4", "video/mp4", "alice/x/a.mp4", 5, 10);
        std::lock_guard lock(session.mutex);
        assert(session.missing_chunks().size() == 5);

        session.mark_received(3, "d3");
        session.mark_received(0, "d0");
        session.mark_received(3, "other");
        session.mark_received(9, "out of range");
        assert(session.received_count == 2);
        assert(session.chunk_digests[3] == "d3");
        assert((session.missing_chunks() == std::vector<std::uint32_t>{1, 2, 4}));
        assert(!session.all_received());

        assert(session.apply(SessionEvent::Pause));
        assert(session.paused_at);
        assert(session.apply(SessionEvent::ChunkReceived));
        assert(session.state == UploadState::Uploading);
        assert(!session.paused_at);
    }

    void test_chunk_staging()
    {
        const auto root = fresh_directory("staging_test");
        ChunkStaging staging(root);

        const auto data = filled(16, 0x5A);
        staging.write("alice_1", 2, data);
        assert(staging.contains("alice_1", 2));
        assert(!staging.contains("alice_1", 1));
        assert(staging.has_session("alice_1"));

        auto in = staging.open("alice_1", 2);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(bytes == std::string(16, 'Z'));

        const auto missing = capture_protocol_error([&]
                                                    { staging.open("alice_1", 1); });
        assert(missing && missing->code() == ErrorCode::StagingFailed);

        // Unsafe characters never escape the staging root.
        staging.write("../evil", 0, data);
        assert(std::filesystem::exists(root / "___evil" / "0.chunk"));

        staging.release("alice_1");
        assert(!staging.has_session("alice_1"));
        cleanup_path(root);
    }

    void test_session_init_validation()
    {
        SessionPolicy policy;
        policy.max_chunk_size = 1024;
        policy.max_file_size = 4096;
        Harness h("init_validation", policy);

        const auto unsupported = capture_protocol_error([&]
                                                        { h.sessions.init(kAlice, "a.xyz", 3, 100); });
        assert(unsupported && unsupported->code() == ErrorCode::UnsupportedFileType);
        assert(std::string(unsupported->what()) == "unsupported file type");
        assert(capture_protocol_error([&]
                                      { h.sessions.init(kAlice, "noextension", 3, 100); }));
        assert(h.sessions.size() == 0);

        const auto zero_chunks = capture_protocol_error([&]
                                                        { h.sessions.init(kAlice, "a.mp4", 0, 100); });
        assert(zero_chunks && std::string(zero_chunks->what()) == "invalid chunk parameters");
        const auto zero_size = capture_protocol_error([&]
                                                      { h.sessions.init(kAlice, "a.mp4", 3, 0); });
        assert(zero_size && zero_size->code() == ErrorCode::InvalidChunkParameters);
        const auto big_chunk = capture_protocol_error([&]
                                                      { h.sessions.init(kAlice, "a.mp4", 1, 2048); });
        assert(big_chunk && big_chunk->code() == ErrorCode::InvalidChunkParameters);
        const auto big_file = capture_protocol_error([&]
                                                     { h.sessions.init(kAlice, "a.mp4", 5, 1024); });
        assert(big_file && big_file->code() == ErrorCode::FileTooLarge);
        assert(h.sessions.size() == 0);

        const auto upper = h.sessions.init(kAlice, "HOLIDAY.MP4", 2, 512);
        assert(upper.session_id.rfind("alice_", 0) == 0);
        assert(upper.session_id.size() == std::string("alice_").size() + 16);

        // alice/YYYYMMDD_HHMMSS/name, keeping only the last path component of the name.
        const auto nested = h.sessions.init(kAlice, "../../etc/report.pdf", 1, 10);
        assert(nested.storage_key.rfind("alice/", 0) == 0);
        assert(nested.storage_key.size() == std::string("alice/").size() + 15 + 1 + std::string("report.pdf").size());
        assert(nested.storage_key.substr(6 + 8, 1) == "_");
        assert(nested.storage_key.ends_with("/report.pdf"));
        assert(h.sessions.size() == 2);
    }

    void test_session_ids_unique()
    {
        Harness h("unique_ids");
        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i)
        {
            ids.insert(h.sessions.init(kAlice, "a.png", 1, 10).session_id);
        }
        assert(ids.size() == 200);
    }

    void test_pause_resume_cancel()
    {
        Harness h("lifecycle");
        const auto init = h.sessions.init(kAlice, "a.mp4", 5, 4);

        const auto not_resumable = capture_protocol_error([&]
                                                          { h.sessions.resume(kAlice, init.session_id); });
        assert(not_resumable && not_resumable->code() == ErrorCode::InvalidSessionState);

        h.receiver.receive(kAlice, init.session_id, 0, filled(4, 1));
        h.receiver.receive(kAlice, init.session_id, 1, filled(4, 2));

        auto paused = h.sessions.pause(kAlice, init.session_id);
        assert(paused.state == UploadState::Paused);
        assert(paused.received_count == 2 && paused.total_chunks == 5);
        paused = h.sessions.pause(kAlice, init.session_id);
        assert(paused.state == UploadState::Paused);

        const auto status = h.sessions.status(kAlice, init.session_id);
        assert(status.state == UploadState::Paused);

        const auto resumed = h.sessions.resume(kAlice, init.session_id);
        assert(resumed.progress.state == UploadState::Uploading);
        assert(resumed.progress.received_count == 2);
        assert((resumed.missing_chunks == std::vector<std::uint32_t>{2, 3, 4}));
        // Resume while uploading is accepted and changes nothing.
        assert(h.sessions.resume(kAlice, init.session_id).missing_chunks.size() == 3);

        assert(h.staging.has_session(init.session_id));
        h.sessions.cancel(kAlice, init.session_id);
        assert(!h.staging.has_session(init.session_id));
        assert(h.sessions.size() == 0);

        for (const auto &error : {capture_protocol_error([&]
                                                         { h.sessions.status(kAlice, init.session_id); }),
                                  capture_protocol_error([&]
                                                         { h.sessions.cancel(kAlice, init.session_id); }),
                                  capture_protocol_error([&]
                                                         { h.sessions.pause(kAlice, init.session_id); }),
                                  capture_protocol_error([&]
                                                         { h.receiver.receive(kAlice, init.session_id, 2, filled(4, 3)); })})
        {
            assert(error && error->code() == ErrorCode::SessionNotFound);
            assert(std::string(error->what()) == "session not found");
        }
    }

    void test_ownership()
    {
        Harness h("ownership");
        const auto init = h.sessions.init(kAlice, "a.mp4", 2, 4);
        const auto foreign = capture_protocol_error([&]
                                                    { h.sessions.status(kBob, init.session_id); });
        assert(foreign && foreign->code() == ErrorCode::SessionNotFound);
        assert(capture_protocol_error([&]
                                      { h.receiver.receive(kBob, init.session_id, 0, filled(4, 1)); }));
        assert(capture_protocol_error([&]
                                      { h.sessions.cancel(kBob, init.session_id); }));
        assert(h.sessions.status(kAlice, init.session_id).state == UploadState::Initialized);
    }

    void test_chunk_receiver_rules()
    {
        Harness h("receiver_rules");
        const auto init = h.sessions.init(kAlice, "a.mp4", 3, 8);
        const auto &id = init.session_id;

        const auto out_of_range = capture_protocol_error([&]
                                                         { h.receiver.receive(kAlice, id, 3, filled(8, 0)); });
        assert(out_of_range && std::string(out_of_range->what()) == "chunk index out of range");
        const auto too_large = capture_protocol_error([&]
                                                      { h.receiver.receive(kAlice, id, 0, filled(9, 0)); });
        assert(too_large && too_large->code() == ErrorCode::ChunkTooLarge);

        auto outcome = h.receiver.receive(kAlice, id, 0, filled(8, 'a'));
        const auto ack = std::get<ChunkAck>(outcome);
        assert(ack.chunk_index == 0 && ack.received_count == 1 && ack.total_chunks == 3);

        // Retransmission with different bytes: first writer wins.
        outcome = h.receiver.receive(kAlice, id, 0, filled(8, 'z'));
        const auto duplicate = std::get<DuplicateChunk>(outcome);
        assert(duplicate.chunk_index == 0 && duplicate.received_count == 1);

        // A retransmitted chunk on a paused session also counts as the client resuming.
        h.sessions.pause(kAlice, id);
        outcome = h.receiver.receive(kAlice, id, 0, filled(8, 'a'));
        assert(std::holds_alternative<DuplicateChunk>(outcome));
        assert(h.sessions.status(kAlice, id).state == UploadState::Uploading);

        h.sessions.pause(kAlice, id);
        outcome = h.receiver.receive(kAlice, id, 2, filled(3, 'c'));
        assert(std::get<ChunkAck>(outcome).received_count == 2);
        assert(h.sessions.status(kAlice, id).state == UploadState::Uploading);

        outcome = h.receiver.receive(kAlice, id, 1, filled(8, 'b'));
        const auto complete = std::get<UploadCompleted>(outcome);
        assert(complete.storage_key == init.storage_key);
        assert(complete.final_size == 8 + 8 + 3);
        assert(h.objects.object(init.storage_key) == std::string(8, 'a') + std::string(8, 'b') + std::string(3, 'c'));
        assert(h.objects.content_types[init.storage_key] == "video/mp4");
        assert(h.objects.calls == 1);

        assert(h.sessions.status(kAlice, id).state == UploadState::Complete);
        assert(!h.staging.has_session(id));

        const auto closed = capture_protocol_error([&]
                                                   { h.receiver.receive(kAlice, id, 1, filled(8, 'b')); });
        assert(closed && std::string(closed->what()) == "session closed");
        const auto pause_closed = capture_protocol_error([&]
                                                         { h.sessions.pause(kAlice, id); });
        assert(pause_closed && pause_closed->code() == ErrorCode::SessionClosed);
    }

    void test_finalize_failure_is_retryable()
    {
        Harness h("finalize_retry");
        const auto init = h.sessions.init(kAlice, "clip.mov", 2, 4);
        h.receiver.receive(kAlice, init.session_id, 0, filled(4, 'x'));

        h.objects.fail_next = 1;
        const auto failure = capture_protocol_error([&]
                                                    { h.receiver.receive(kAlice, init.session_id, 1, filled(2, 'y')); });
        assert(failure && failure->code() == ErrorCode::StorageCommitFailed);
        assert(std::string(failure->what()).rfind("storage commit failed", 0) == 0);

        const auto status = h.sessions.status(kAlice, init.session_id);
        assert(status.state == UploadState::Uploading);
        assert(status.received_count == 2);
        assert(h.staging.has_session(init.session_id));

        // Resending any chunk of the complete set re-runs the commit.
        const auto outcome = h.receiver.receive(kAlice, init.session_id, 0, filled(4, 'x'));
        const auto complete = std::get<UploadCompleted>(outcome);
        assert(complete.final_size == 6);
        assert(h.objects.calls == 2);
        assert(h.objects.object(init.storage_key) == "xxxxyy");
        assert(h.sessions.status(kAlice, init.session_id).state == UploadState::Complete);
    }

    void test_sweep()
    {
        SessionPolicy policy;
        policy.idle_timeout = std::chrono::seconds(60);
        policy.terminal_retention = std::chrono::seconds(600);
        Harness h("sweep", policy);

        const auto idle = h.sessions.init(kAlice, "a.mp4", 2, 4);
        h.receiver.receive(kAlice, idle.session_id, 0, filled(4, 1));
        const auto done = h.sessions.init(kAlice, "b.mp4", 1, 4);
        h.receiver.receive(kAlice, done.session_id, 0, filled(4, 2));

        const auto now = std::chrono::system_clock::now();
        assert(h.sessions.sweep(now) == 0);
        assert(h.sessions.sweep(now + std::chrono::seconds(120)) == 1);
        assert(!h.staging.has_session(idle.session_id));
        assert(capture_protocol_error([&]
                                      { h.sessions.status(kAlice, idle.session_id); }));
        assert(h.sessions.status(kAlice, done.session_id).state == UploadState::Complete);

        assert(h.sessions.sweep(now + std::chrono::seconds(1200)) == 1);
        assert(h.sessions.size() == 0);
    }

    void test_sweep_skips_busy_sessions()
    {
        SessionPolicy policy;
        policy.idle_timeout = std::chrono::seconds(60);
        Harness h("sweep_busy", policy);

        const auto busy = h.sessions.init(kAlice, "a.mp4", 2, 4);
        const auto quiet = h.sessions.init(kAlice, "b.mp4", 2, 4);
        const auto busy_session = h.sessions.find(kAlice, busy.session_id);

        // Another thread holds the session lock, as a long chunk write would.
        std::promise<void> locked;
        std::promise<void> release;
        std::thread holder([&]
                           {
                               std::lock_guard lock(busy_session->mutex);
                               locked.set_value();
                               release.get_future().wait(); });
        locked.get_future().wait();

        const auto later = std::chrono::system_clock::now() + std::chrono::seconds(120);
        assert(h.sessions.sweep(later) == 1);
        assert(h.sessions.size() == 1);
        assert(h.sessions.find(kAlice, busy.session_id) == busy_session);
        assert(capture_protocol_error([&]
                                      { h.sessions.find(kAlice, quiet.session_id); }));

        release.set_value();
        holder.join();
        assert(h.sessions.sweep(later) == 1);
        assert(h.sessions.size() == 0);
    }

    void test_committed_key_recorded()
    {
        Harness h("committed_key");
        const auto init = h.sessions.init(kAlice, "clip.mp4", 1, 4);
        h.objects.objects[init.storage_key] = "older";

        const auto complete = std::get<UploadCompleted>(h.receiver.receive(kAlice, init.session_id, 0, filled(4, 'n')));
        assert(complete.storage_key != init.storage_key);
        assert(complete.storage_key.ends_with("/clip_1.mp4"));
        assert(h.objects.object(init.storage_key) == "older");
        assert(h.objects.object(complete.storage_key) == "nnnn");

        const auto session = h.sessions.find(kAlice, init.session_id);
        std::lock_guard lock(session->mutex);
        assert(session->state == UploadState::Complete);
        assert(session->committed_key == complete.storage_key);
        assert(session->final_size == std::uint64_t{4});
    }

    void test_filesystem_object_store()
    {
        const auto root = fresh_directory("objects_test");
        FilesystemObjectStore store(root);

        std::istringstream first("hello world");
        const auto committed = store.commit(first, "alice/20240101_120000/a.pdf", "application/pdf");
        assert(committed.key == "alice/20240101_120000/a.pdf");
        assert(committed.size == 11);

        const auto path = store.object_path(committed.key);
        assert(path == root / "objects" / "alice" / "20240101_120000" / "a.pdf");
        std::ifstream in(path, std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content == "hello world");

        std::ifstream meta_in(path.string() + ".meta.json");
        const auto meta = nlohmann::json::parse(meta_in);
        assert(meta.at("size").get<std::uint64_t>() == 11);
        assert(meta.at("content_type").get<std::string>() == "application/pdf");
        assert(meta.at("blake2b").get<std::string>() == crypto::hash_text("hello world"));
        assert(meta.contains("committed_at"));

        std::istringstream second("again");
        const auto collision = store.commit(second, "alice/20240101_120000/a.pdf", "application/pdf");
        assert(collision.key == "alice/20240101_120000/a_1.pdf");

        bool rejected = false;
        try
        {
            std::istringstream evil("x");
            store.commit(evil, "../outside.pdf", "application/pdf");
        }
        catch (const StorageError &)
        {
            rejected = true;
        }
        assert(rejected);
        assert(!std::filesystem::exists(root / "outside.pdf"));
        cleanup_path(root);
    }

    void test_token_store()
    {
        const auto root = fresh_directory("tokens_test");
        const auto db = root / "tokens.json";
        {
            TokenStore store(db);
            const auto token = store.issue("u-1", "alice", std::nullopt);
            assert(token.size() == 48);
            const auto identity = store.resolve(token);
            assert(identity && identity->user_id == "u-1" && identity->username == "alice");
            assert(!store.resolve("not-a-token"));

            store.add("expired-token", "u-2", "bob", std::chrono::seconds(-10));
            assert(!store.resolve("expired-token"));

            store.add("static-token", "u-3", "carol", std::chrono::hours(1));
            assert(store.resolve("static-token"));
            assert(store.revoke("static-token"));
            assert(!store.revoke("static-token"));
            assert(!store.resolve("static-token"));

            std::ifstream in(db);
            const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            assert(text.find(token) == std::string::npos);
            assert(text.find(crypto::hash_text(token)) != std::string::npos);
        }

        TokenStore reopened(db);
        assert(!reopened.resolve("late-token"));
        TokenStore writer(db);
        writer.add("late-token", "u-4", "dave", std::nullopt);
        assert(reopened.resolve("late-token"));
        cleanup_path(root);
    }

    void test_config_file()
    {
        const auto root = fresh_directory("config_test");
        const auto path = root / "server.json";
        {
            std::ofstream out(path);
            out << R"({"port": 9100, "root": "/srv/vault", "max_chunk_size": 2048,
                       "session_idle_timeout_seconds": 30,
                       "allowed_extensions": {"MKV": "video/x-matroska", ".txt": "text/plain"}})";
        }
        ServerConfig config;
        apply_config_file(path, config);
        assert(config.port == 9100);
        assert(config.root == "/srv/vault");
        assert(config.max_chunk_size == 2048);
        assert(config.session_idle_timeout == std::chrono::seconds(30));
        assert(config.terminal_retention == std::chrono::hours(1));
        assert(config.allowed_extensions.size() == 2);
        assert(config.allowed_extensions.at(".mkv") == "video/x-matroska");
        assert(resolve_tokens_path(config) == std::filesystem::path("/srv/vault") / "tokens.json");

        const auto policy = make_session_policy(config);
        assert(policy.max_chunk_size == 2048);
        assert(policy.allowed_extensions.contains(".txt"));

        assert(default_allowed_extensions().size() == 13);
        assert(default_allowed_extensions().at(".png") == "image/png");
        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_transition_table();
    test_upload_session_tracking();
    test_chunk_staging();
    test_session_init_validation();
    test_session_ids_unique();
    test_pause_resume_cancel();
    test_ownership();
    test_chunk_receiver_rules();
    test_finalize_failure_is_retryable();
    test_sweep();
    test_sweep_skips_busy_sessions();
    test_committed_key_recorded();
    test_filesystem_object_store();
    test_token_store();
    test_config_file();
}
