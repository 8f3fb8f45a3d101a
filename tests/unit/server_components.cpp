#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "artistore/crypto.hpp"
#include "artistore/identifiers.hpp"
#include "artistore/server/artifact_directory.hpp"
#include "artistore/server/assembler.hpp"
#include "artistore/server/chunk_receiver.hpp"
#include "artistore/server/chunk_staging.hpp"
#include "artistore/server/credential_store.hpp"
#include "artistore/server/duplicate_index.hpp"
#include "artistore/server/expiration_reaper.hpp"
#include "artistore/server/progress_tracker.hpp"
#include "artistore/server/session_store.hpp"
#include "artistore/server/storage_sink.hpp"
#include "artistore/server/validation.hpp"
#include "test_support.hpp"

using namespace artistore;
using namespace artistore::server;

namespace
{

    UploadLimits test_limits()
    {
        UploadLimits limits;
        limits.min_chunk_size = 1024;
        limits.max_chunk_size = 1'000'000;
        limits.max_object_size = 10'000'000;
        limits.max_chunks = 100;
        return limits;
    }

    // Every upload-core module wired over one temporary root.
    struct CoreFixture
    {
        explicit CoreFixture(const std::string &name, UploadLimits upload_limits = test_limits())
            : dir(name),
              limits(upload_limits),
              store(dir.path(), limits, clock.clock()),
              staging(dir.path()),
              index(dir.path()),
              sink(dir.path()),
              chunk_pipeline(make_chunk_pipeline(limits)),
              file_pipeline(make_file_pipeline(limits, limits.max_object_size, std::make_shared<HeuristicScanner>())),
              receiver(store, staging, chunk_pipeline),
              tracker(store, clock.clock()),
              assembler(store, staging, index, sink, file_pipeline)
        {
        }

        UploadSession create(std::uint64_t total, std::uint64_t chunk_size, const std::string &artifact = "model-a",
                             const std::string &filename = "weights.bin")
        {
            auto created = store.create(artifact, filename, total, chunk_size, "application/octet-stream");
            assert(created.ok());
            return created.value();
        }

        Result<ChunkUploadResult> send(const UploadSession &session, const std::vector<std::byte> &data,
                                       std::uint64_t chunk_number)
        {
            const auto offset = chunk_number * session.chunk_size_bytes;
            const auto length = session.expected_chunk_size(chunk_number);
            const auto bytes = testing::slice(data, offset, length);
            return receiver.accept_chunk(session.session_id, chunk_number, crypto::sha256_hex(bytes), bytes);
        }

        SessionStatus status_of(const std::string &session_id)
        {
            return store.get(session_id).value().status;
        }

        testing::TempDir dir;
        testing::ManualClock clock;
        UploadLimits limits;
        SessionStore store;
        ChunkStaging staging;
        DuplicateIndex index;
        LocalStorageSink sink;
        ValidationPipeline chunk_pipeline;
        ValidationPipeline file_pipeline;
        ChunkReceiver receiver;
        ProgressTracker tracker;
        Assembler assembler;
    };

    void test_session_store_bounds()
    {
        CoreFixture fx("store_bounds");

        assert(fx.store.create("model-a", "w.bin", 10'000, 512).code() == ErrorCode::InvalidParameters);
        assert(fx.store.create("model-a", "w.bin", 10'000, 2'000'000).code() == ErrorCode::InvalidParameters);
        assert(fx.store.create("model-a", "w.bin", 0, 4096).code() == ErrorCode::InvalidParameters);
        assert(fx.store.create("model-a", "w.bin", 20'000'000, 1'000'000).code() == ErrorCode::InvalidParameters);
        // 101 chunks exceeds max_chunks.
        assert(fx.store.create("model-a", "w.bin", 101 * 1024, 1024).code() == ErrorCode::InvalidParameters);
        assert(fx.store.create("", "w.bin", 10'000, 4096).code() == ErrorCode::InvalidParameters);

        const auto session = fx.create(10'000, 4096);
        assert(is_ulid(session.session_id));
        assert(session.declared_total_chunks == 3);
        assert(session.last_chunk_size() == 10'000 - 2 * 4096);
        assert(session.status == SessionStatus::Active);
        assert(session.bytes_received == 0);
        assert(session.expires_at == fx.clock.now() + fx.limits.session_ttl);
        assert(std::filesystem::exists(fx.dir.path() / ".artistore" / "sessions" / (session.session_id + ".json")));

        const auto other = fx.create(10'000, 4096);
        assert(other.session_id != session.session_id);
        assert(fx.store.size() == 2);
        assert(fx.store.get("missing").code() == ErrorCode::NotFound);
    }

    void test_out_of_order_upload()
    {
        CoreFixture fx("out_of_order");
        const auto data = testing::make_bytes(10'000);
        const auto session = fx.create(data.size(), 4096);

        for (const std::uint64_t chunk : {2u, 0u, 1u})
        {
            auto accepted = fx.send(session, data, chunk);
            assert(accepted.ok());
            assert(accepted->checksum_verified);
            assert(accepted->outcome == ChunkRecordOutcome::Added);
        }
        assert(fx.store.get(session.session_id).value().bytes_received == data.size());

        auto finalized = fx.assembler.finalize(session.session_id, crypto::sha256_hex(data));
        assert(finalized.ok());
        assert(!finalized->deduplicated);
        assert(finalized->artifact_id == "model-a");
        assert(finalized->file.size_bytes == data.size());
        assert(finalized->file.strong_digest == crypto::sha256_hex(data));
        assert(finalized->file.fast_checksum == crypto::fast_checksum(data));
        assert(finalized->file.version == 1);
        assert(fx.status_of(session.session_id) == SessionStatus::Complete);
        assert(!fx.staging.contains(session.session_id));

        // The stored object holds exactly the uploaded bytes.
        const std::filesystem::path location(finalized->file.download_location);
        assert(std::filesystem::exists(location));
        assert(std::filesystem::file_size(location) == data.size());
        assert(crypto::hash_file(location).sha256 == crypto::sha256_hex(data));

        // Finalize is idempotent once complete.
        auto again = fx.assembler.finalize(session.session_id, crypto::sha256_hex(data));
        assert(again.ok());
        assert(again->file.file_id == finalized->file.file_id);

        // No chunk is accepted after completion.
        auto late = fx.send(session, data, 0);
        assert(late.code() == ErrorCode::SessionClosed);
        assert(status_code(late.code()) == 410);
    }

    void test_incomplete_finalize()
    {
        CoreFixture fx("incomplete");
        const auto data = testing::make_bytes(10'000);
        const auto session = fx.create(data.size(), 4096);
        assert(fx.send(session, data, 0).ok());
        assert(fx.send(session, data, 2).ok());

        auto finalized = fx.assembler.finalize(session.session_id, crypto::sha256_hex(data));
        assert(finalized.code() == ErrorCode::IncompleteUpload);
        assert(fx.status_of(session.session_id) == SessionStatus::Active);

        assert(fx.send(session, data, 1).ok());
        assert(fx.assembler.finalize(session.session_id, crypto::sha256_hex(data)).ok());
    }

    void test_chunk_rejections()
    {
        CoreFixture fx("chunk_rejections");
        const auto data = testing::make_bytes(10'000);
        const auto session = fx.create(data.size(), 4096);
        const auto first = testing::slice(data, 0, 4096);
        const auto digest = crypto::sha256_hex(first);

        assert(fx.receiver.accept_chunk(session.session_id, 3, digest, first).code() == ErrorCode::OutOfRange);
        assert(fx.receiver.accept_chunk(session.session_id, 0, digest, testing::slice(data, 0, 4000)).code() ==
               ErrorCode::SizeMismatch);
        // The last chunk must carry exactly the remainder.
        assert(fx.receiver.accept_chunk(session.session_id, 2, digest, first).code() == ErrorCode::SizeMismatch);
        assert(fx.receiver.accept_chunk(session.session_id, 0, std::string(64, '0'), first).code() ==
               ErrorCode::ChecksumMismatch);
        assert(fx.receiver.accept_chunk(session.session_id, 0, "abc", first).code() == ErrorCode::InvalidParameters);
        assert(fx.receiver.accept_chunk("01ARZ3NDEKTSV4RRFFQ69G5FAV", 0, digest, first).code() == ErrorCode::NotFound);

        const auto state = fx.store.get(session.session_id).value();
        assert(state.bytes_received == 0);
        assert(state.received_chunks.empty());

        // Upper-case digests are accepted.
        std::string upper = digest;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(fx.receiver.accept_chunk(session.session_id, 0, upper, first).ok());
    }

    void test_chunk_resend_and_replace()
    {
        CoreFixture fx("chunk_replace");
        const auto data = testing::make_bytes(10'000);
        const auto session = fx.create(data.size(), 4096);

        assert(fx.send(session, data, 0)->outcome == ChunkRecordOutcome::Added);
        auto resent = fx.send(session, data, 0);
        assert(resent.ok());
        assert(resent->outcome == ChunkRecordOutcome::Unchanged);
        assert(resent->bytes_received == 4096);

        // Different bytes for the same index replace the earlier chunk.
        const auto replacement = testing::make_bytes(4096, 99);
        auto replaced = fx.receiver.accept_chunk(session.session_id, 0, crypto::sha256_hex(replacement), replacement);
        assert(replaced.ok());
        assert(replaced->outcome == ChunkRecordOutcome::Replaced);
        assert(replaced->bytes_received == 4096);

        const auto state = fx.store.get(session.session_id).value();
        assert(state.received_chunks.size() == 1);
        assert(state.received_chunks.at(0).strong_digest == crypto::sha256_hex(replacement));
        assert(fx.staging.size(session.session_id, 0) == 4096u);
    }

    void test_integrity_failure_keeps_session()
    {
        CoreFixture fx("integrity");
        const auto data = testing::make_bytes(6'000);
        const auto session = fx.create(data.size(), 4096);
        assert(fx.send(session, data, 0).ok());
        assert(fx.send(session, data, 1).ok());

        auto wrong = fx.assembler.finalize(session.session_id, crypto::sha256_hex(testing::make_bytes(6'000, 1)));
        assert(wrong.code() == ErrorCode::IntegrityCheckFailed);
        assert(fx.status_of(session.session_id) == SessionStatus::Active);
        assert(fx.index.size() == 0);

        assert(fx.assembler.finalize(session.session_id, "not-a-digest").code() == ErrorCode::InvalidParameters);
        assert(fx.assembler.finalize(session.session_id, crypto::sha256_hex(data)).ok());
    }

    void test_finalize_deduplicates()
    {
        CoreFixture fx("dedup");
        const auto data = testing::make_bytes(5'000);
        const auto first = fx.create(data.size(), 4096, "model-a");
        const auto second = fx.create(data.size(), 4096, "model-b");
        for (const auto &session : {first, second})
        {
            assert(fx.send(session, data, 0).ok());
            assert(fx.send(session, data, 1).ok());
        }

        auto original = fx.assembler.finalize(first.session_id, crypto::sha256_hex(data));
        auto duplicate = fx.assembler.finalize(second.session_id, crypto::sha256_hex(data));
        assert(original.ok() && duplicate.ok());
        assert(!original->deduplicated);
        assert(duplicate->deduplicated);
        assert(duplicate->artifact_id == "model-b");
        assert(duplicate->file.file_id == original->file.file_id);
        assert(fx.index.size() == 1);
        assert(fx.status_of(second.session_id) == SessionStatus::Complete);
    }

    // A source tarball mentions subprocess in plain text within its first block.
    std::vector<std::byte> make_code_tarball(std::size_t size)
    {
        std::vector<std::byte> data(size, std::byte{0});
        const std::string name = "code/train.py";
        const std::string magic = "ustar";
        const std::string body = "import subprocess\nsubprocess.run(['python', 'prepare.py'])\n";
        std::copy_n(reinterpret_cast<const std::byte *>(name.data()), name.size(), data.begin());
        std::copy_n(reinterpret_cast<const std::byte *>(magic.data()), magic.size(), data.begin() + 257);
        std::copy_n(reinterpret_cast<const std::byte *>(body.data()), body.size(), data.begin() + 512);
        return data;
    }

    void test_flagged_content_still_finalizes()
    {
        CoreFixture fx("code_tarball");
        const auto data = make_code_tarball(2'000);

        // The whole-file pipeline flags the tarball when asked directly.
        const auto report = fx.file_pipeline.run(ValidationCandidate{
            .filename = "code.tar",
            .content_type = "application/x-tar",
            .size_bytes = data.size(),
            .content = data,
        });
        assert(!report.passed);
        assert(report.failed_check == "malware");

        auto created = fx.store.create("model-a", "code.tar", data.size(), 2048, "application/x-tar");
        assert(created.ok());
        const auto session = created.value();
        assert(fx.send(session, data, 0).ok());

        // Finalize only verifies the digest; it never re-scans the content.
        auto finalized = fx.assembler.finalize(session.session_id, crypto::sha256_hex(data));
        assert(finalized.ok());
        assert(finalized->file.size_bytes == data.size());
        assert(fx.status_of(session.session_id) == SessionStatus::Complete);
        assert(!fx.staging.contains(session.session_id));
        assert(fx.index.size() == 1);
        assert(crypto::hash_file(finalized->file.download_location).sha256 == crypto::sha256_hex(data));
    }

    void test_expired_session()
    {
        CoreFixture fx("expired");
        const auto data = testing::make_bytes(5'000);
        const auto session = fx.create(data.size(), 4096);
        assert(fx.send(session, data, 0).ok());
        assert(fx.staging.contains(session.session_id));

        // Exactly at the deadline the session is still usable.
        fx.clock.advance(fx.limits.session_ttl);
        assert(fx.send(session, data, 1).ok());

        fx.clock.advance(std::chrono::seconds(1));
        assert(fx.assembler.finalize(session.session_id, crypto::sha256_hex(data)).code() ==
               ErrorCode::SessionExpired);
        assert(fx.status_of(session.session_id) == SessionStatus::Expired);
        assert(!fx.staging.contains(session.session_id));
        assert(fx.send(session, data, 0).code() == ErrorCode::SessionExpired);
    }

    void test_progress_tracking()
    {
        CoreFixture fx("progress");
        const auto data = testing::make_bytes(10'000);
        const auto session = fx.create(data.size(), 4096);

        auto initial = fx.tracker.progress(session.session_id);
        assert(initial.ok());
        assert(initial->percent_complete == 0.0);
        assert(initial->bytes_remaining == data.size());
        assert(initial->total_chunks == 3);
        assert(initial->speed_mbps == 0.0);
        assert(!initial->eta_seconds.has_value());

        assert(fx.send(session, data, 0).ok());
        fx.clock.advance(std::chrono::seconds(2));
        assert(fx.send(session, data, 1).ok());

        auto midway = fx.tracker.progress(session.session_id);
        assert(midway->chunks_received == 2);
        assert(midway->bytes_received == 8192);
        assert(midway->percent_complete > 0.8 && midway->percent_complete < 0.9);
        assert(midway->speed_mbps > 0.0);
        assert(midway->eta_seconds.has_value() && *midway->eta_seconds > 0.0);

        // Samples older than the window no longer count toward speed.
        fx.clock.advance(fx.limits.throughput_window + std::chrono::seconds(5));
        auto stalled = fx.tracker.progress(session.session_id);
        assert(stalled->speed_mbps == 0.0);
        assert(!stalled->eta_seconds.has_value());

        assert(fx.send(session, data, 2).ok());
        auto done = fx.tracker.progress(session.session_id);
        assert(done->percent_complete == 1.0);
        assert(done->bytes_remaining == 0);

        assert(fx.tracker.progress("unknown").code() == ErrorCode::NotFound);
    }

    void test_progress_never_rounds_to_complete()
    {
        UploadSession session;
        session.declared_total_size = 1ULL << 60;
        session.declared_total_chunks = 1ULL << 30;
        session.chunk_size_bytes = 1ULL << 30;
        session.bytes_received = session.declared_total_size - 1;
        ThroughputWindow window;
        const auto progress = compute_progress(session, window, TimePoint{});
        assert(progress.percent_complete < 1.0);
        assert(progress.bytes_remaining == 1);
    }

    void test_reaper_sweep()
    {
        CoreFixture fx("reaper");
        const auto data = testing::make_bytes(2'000);
        const auto idle = fx.create(data.size(), 2048, "model-a", "idle.bin");
        const auto finished = fx.create(data.size(), 2048, "model-a", "done.bin");
        const auto stuck = fx.create(data.size(), 2048, "model-a", "stuck.bin");
        assert(fx.send(idle, data, 0).ok());
        assert(fx.send(finished, data, 0).ok());
        assert(fx.assembler.finalize(finished.session_id, crypto::sha256_hex(data)).ok());
        assert(fx.store.mark_status(stuck.session_id, SessionStatus::Finalizing).ok());

        auto report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.expired == 0 && report.purged == 0);

        fx.clock.advance(fx.limits.session_ttl + std::chrono::seconds(1));
        report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.expired == 1);
        assert(fx.status_of(idle.session_id) == SessionStatus::Expired);
        assert(!fx.staging.contains(idle.session_id));
        // A finalize in flight gets a grace period before it is expired.
        assert(fx.status_of(stuck.session_id) == SessionStatus::Finalizing);

        fx.clock.advance(std::chrono::hours(1));
        report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.expired == 1);
        assert(fx.status_of(stuck.session_id) == SessionStatus::Expired);

        // Terminal sessions are forgotten one TTL after their deadline.
        fx.clock.advance(fx.limits.session_ttl);
        report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.purged == 3);
        assert(fx.store.size() == 0);
        assert(fx.store.get(finished.session_id).code() == ErrorCode::NotFound);
        // The finalized file outlives its session.
        assert(fx.index.find(crypto::sha256_hex(data)).has_value());
    }

    void test_reaper_skips_locked_session()
    {
        CoreFixture fx("reaper_locked");
        const auto data = testing::make_bytes(2'000);
        const auto busy = fx.create(data.size(), 2048, "model-a", "busy.bin");
        assert(fx.send(busy, data, 0).ok());
        fx.clock.advance(fx.limits.session_ttl + std::chrono::seconds(1));

        // Another thread holds the session as an in-flight request would.
        std::promise<void> locked;
        std::promise<void> release;
        std::thread holder([&]
                           {
            auto handle = fx.store.open(busy.session_id);
            assert(handle.ok());
            locked.set_value();
            release.get_future().wait(); });
        locked.get_future().wait();

        auto report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.skipped == 1);
        assert(report.expired == 0);

        release.set_value();
        holder.join();
        assert(fx.status_of(busy.session_id) == SessionStatus::Active);
        assert(fx.staging.contains(busy.session_id));

        report = sweep_sessions(fx.store, fx.staging, std::chrono::hours(1));
        assert(report.skipped == 0);
        assert(report.expired == 1);
        assert(fx.status_of(busy.session_id) == SessionStatus::Expired);
        assert(!fx.staging.contains(busy.session_id));
    }

    void test_reaper_stops_from_another_thread()
    {
        CoreFixture fx("reaper_stop");
        asio::io_context io_context;
        ExpirationReaper reaper(io_context, fx.store, fx.staging, std::chrono::hours(1), std::chrono::hours(1));
        reaper.start();
        reaper.start();

        std::vector<std::thread> workers;
        for (int i = 0; i < 2; ++i)
        {
            workers.emplace_back([&io_context]
                                 { io_context.run(); });
        }
        // The event loop only runs dry once the pending timer is cancelled.
        reaper.stop();
        for (auto &worker : workers)
        {
            worker.join();
        }
        reaper.stop();
        assert(reaper.sweep_now().expired == 0);
    }

    void test_session_store_restart()
    {
        testing::TempDir dir("store_restart");
        testing::ManualClock clock;
        const auto limits = test_limits();
        const auto data = testing::make_bytes(5'000);
        std::string active_id;
        std::string finalizing_id;
        {
            SessionStore store(dir.path(), limits, clock.clock());
            active_id = store.create("model-a", "a.bin", data.size(), 4096).value().session_id;
            finalizing_id = store.create("model-a", "b.bin", data.size(), 4096).value().session_id;
            assert(store.record_chunk(active_id, 0, 4096, crypto::sha256_hex(testing::slice(data, 0, 4096))).ok());
            assert(store.mark_status(finalizing_id, SessionStatus::Finalizing).ok());
            assert(store.mark_status(active_id, SessionStatus::Complete).code() == ErrorCode::InvalidState);
        }

        SessionStore restored(dir.path(), limits, clock.clock());
        assert(restored.size() == 2);
        const auto active = restored.get(active_id).value();
        assert(active.bytes_received == 4096);
        assert(active.received_chunks.contains(0));
        assert(active.filename == "a.bin");
        assert(restored.get(finalizing_id).value().status == SessionStatus::Active);
    }

    void test_validation_checks()
    {
        const auto limits = test_limits();
        const auto declarations = make_declaration_pipeline(limits);

        ValidationCandidate candidate{.filename = "weights.bin", .size_bytes = 5'000};
        assert(declarations.run(candidate).passed);

        candidate.filename = "../weights.bin";
        auto report = declarations.run(candidate);
        assert(!report.passed);
        assert(report.failed_check == "filename");
        assert(report.code == ErrorCode::ValidationFailed);

        candidate.filename = "con.txt";
        assert(declarations.run(candidate).failed_check == "filename");
        candidate.filename = std::string(300, 'a') + ".bin";
        assert(declarations.run(candidate).failed_check == "filename");

        candidate.filename = "installer.bin";
        candidate.content_type = "application/x-msdownload";
        report = declarations.run(candidate);
        assert(report.failed_check == "mime_type");
        // The pipeline stops at the first failure.
        assert(report.results.size() == 1);

        candidate.content_type = "";
        candidate.size_bytes = limits.max_object_size + 1;
        report = declarations.run(candidate);
        assert(report.failed_check == "size");
        assert(report.code == ErrorCode::PayloadTooLarge);

        assert(effective_content_type("model.bin", "Application/JSON; charset=utf-8") == "application/json");
        assert(effective_content_type("weights.h5", "") == "application/x-hdf");
        assert(effective_content_type("setup.sh", "") == "application/x-sh");
        assert(MimeTypeCheck().evaluate(ValidationCandidate{.filename = "setup.sh", .size_bytes = 10}).passed);
        assert(MimeTypeCheck().evaluate(ValidationCandidate{.filename = "loader.js", .size_bytes = 10}).passed);
        assert(guess_content_type("archive.unknownext") == "application/octet-stream");
    }

    void test_file_type_detection()
    {
        const auto png = testing::to_bytes("\x89PNG\r\n\x1a\n0000");
        assert(detect_file_type(png) == "PNG image");
        const std::vector<std::byte> pickle{std::byte{0x80}, std::byte{0x04}, std::byte{0x95}};
        assert(detect_file_type(pickle) == "Pickle data");

        std::vector<std::byte> safetensors(8 + 2);
        safetensors[0] = std::byte{2};
        safetensors[8] = std::byte{'{'};
        safetensors[9] = std::byte{'}'};
        assert(detect_file_type(safetensors) == "Safetensors data");

        assert(detect_file_type(testing::to_bytes("epochs: 10\nlr: 0.01\n")) == "Text");
        assert(detect_file_type(testing::make_bytes(64)) == "Unknown/Binary");

        const auto limits = test_limits();
        const auto pipeline = make_file_pipeline(limits, limits.max_object_size, std::make_shared<HeuristicScanner>());
        const auto binary = testing::make_bytes(64);
        auto report = pipeline.run(ValidationCandidate{.filename = "blob.bin", .size_bytes = 64, .content = binary});
        assert(report.passed);
        assert(report.warnings.size() == 1);
        assert(report.results.size() == 5);

        const auto script = testing::to_bytes("import os\nos.system('ls')\n");
        report = pipeline.run(ValidationCandidate{.filename = "notes.txt", .size_bytes = script.size(), .content = script});
        assert(report.failed_check == "malware");
        // Script extensions are exempt from keyword heuristics.
        report = pipeline.run(ValidationCandidate{.filename = "train.py", .size_bytes = script.size(), .content = script});
        assert(report.passed);

        const auto unscanned = make_file_pipeline(limits, limits.max_object_size, nullptr);
        assert(unscanned.run(ValidationCandidate{.filename = "notes.txt", .size_bytes = script.size(), .content = script})
                   .passed);
    }

    void test_chunk_size_accounting()
    {
        const auto limits = test_limits();
        SizeCheck check(limits.max_object_size, limits.max_chunk_size);
        ValidationCandidate chunk{
            .filename = "w.bin",
            .size_bytes = 4096,
            .declared_total = 10'000,
            .bytes_already_received = 8192,
            .is_chunk = true,
        };
        auto outcome = check.evaluate(chunk);
        assert(!outcome.passed);
        assert(outcome.code == ErrorCode::SizeMismatch);

        // Replacing an existing chunk only counts the size difference.
        chunk.replaced_bytes = 4096;
        assert(check.evaluate(chunk).passed);

        chunk.size_bytes = limits.max_chunk_size + 1;
        assert(check.evaluate(chunk).code == ErrorCode::PayloadTooLarge);
    }

    void test_duplicate_index()
    {
        testing::TempDir dir("duplicate_index");
        const auto digest = crypto::sha256_hex(testing::to_bytes("weights"));
        FinalizedFile file{
            .file_id = generate_ulid(),
            .artifact_id = "model-a",
            .filename = "w.bin",
            .size_bytes = 7,
            .strong_digest = digest,
        };
        {
            DuplicateIndex index(dir.path());
            auto [stored, inserted] = index.insert(file);
            assert(inserted);
            assert(stored.version == 1);

            auto rival = file;
            rival.file_id = generate_ulid();
            auto [existing, rival_inserted] = index.insert(rival);
            assert(!rival_inserted);
            assert(existing.file_id == file.file_id);

            auto second = file;
            second.file_id = generate_ulid();
            second.strong_digest = crypto::sha256_hex(testing::to_bytes("other"));
            assert(index.insert(second).first.version == 2);
        }

        DuplicateIndex reloaded(dir.path());
        assert(reloaded.size() == 2);
        assert(reloaded.find(digest)->file_id == file.file_id);
        assert(!reloaded.find_excluding(digest, "model-a").has_value());
        assert(reloaded.find_excluding(digest, "model-b").has_value());
        assert(!reloaded.find(std::string(64, 'f')).has_value());
    }

    void test_credential_store()
    {
        testing::TempDir dir("credentials");
        {
            CredentialStore store(dir.path());
            assert(store.register_user("alice", "short").code() == ErrorCode::InvalidParameters);
            assert(store.register_user("", "long enough").code() == ErrorCode::InvalidParameters);
            assert(store.register_user("alice", "long enough").ok());
            assert(store.register_user("alice", "another one").code() == ErrorCode::InvalidState);
            assert(store.authenticate("alice", "long enough"));
            assert(!store.authenticate("alice", "wrong password"));
            assert(!store.authenticate("bob", "long enough"));
        }
        CredentialStore reloaded(dir.path());
        assert(reloaded.authenticate("alice", "long enough"));
    }

    void test_artifact_directory()
    {
        testing::TempDir dir("artifacts");
        FileArtifactDirectory artifacts(dir.path());
        assert(artifacts.open_mode());
        assert(artifacts.exists("anything"));
        assert(!artifacts.exists("../escape"));
        assert(!is_valid_artifact_id(""));
        assert(!is_valid_artifact_id(std::string(129, 'a')));
        assert(is_valid_artifact_id("resnet_50.v2-final"));

        std::filesystem::create_directories(dir.path() / ".artistore");
        {
            std::ofstream out(dir.path() / ".artistore" / "artifacts.json");
            out << nlohmann::json::array({"model-a", "model-b"}).dump();
        }
        assert(!artifacts.open_mode());
        assert(artifacts.exists("model-a"));
        assert(!artifacts.exists("model-c"));
    }

    void test_local_storage_sink()
    {
        testing::TempDir dir("sink");
        LocalStorageSink sink(dir.path());
        const std::string payload = "checkpoint bytes";
        std::istringstream input(payload);
        const StoredObject object{
            .file_id = generate_ulid(),
            .artifact_id = "model-a",
            .filename = "ckpt.PT",
            .size_bytes = payload.size(),
        };
        const auto location = sink.store(input, object);
        const std::filesystem::path path(location);
        assert(path.parent_path().filename() == "model-a");
        assert(path.filename() == object.file_id + ".pt");
        assert(std::filesystem::file_size(path) == payload.size());

        sink.discard(location);
        assert(!std::filesystem::exists(path));

        // A short stream is not accepted as the object.
        std::istringstream truncated("short");
        bool rejected = false;
        try
        {
            (void)sink.store(truncated, object);
        }
        catch (const std::exception &)
        {
            rejected = true;
        }
        assert(rejected);
    }

} // namespace

void run_server_component_tests()
{
    test_session_store_bounds();
    test_out_of_order_upload();
    test_incomplete_finalize();
    test_chunk_rejections();
    test_chunk_resend_and_replace();
    test_integrity_failure_keeps_session();
    test_finalize_deduplicates();
    test_flagged_content_still_finalizes();
    test_expired_session();
    test_progress_tracking();
    test_progress_never_rounds_to_complete();
    test_reaper_sweep();
    test_reaper_skips_locked_session();
    test_reaper_stops_from_another_thread();
    test_session_store_restart();
    test_validation_checks();
    test_file_type_detection();
    test_chunk_size_accounting();
    test_duplicate_index();
    test_credential_store();
    test_artifact_directory();
    test_local_storage_sink();
}
