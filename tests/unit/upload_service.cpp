#include <algorithm>
#include <atomic>
#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "artistore/crypto.hpp"
#include "artistore/encoding/base64.hpp"
#include "artistore/server/upload_service.hpp"
#include "test_support.hpp"

using namespace artistore;
using namespace artistore::server;

namespace
{

    std::unique_ptr<UploadService> make_service(const testing::TempDir &dir, const testing::ManualClock &clock,
                                                bool malware_scan = true)
    {
        ServerConfig config;
        config.root = dir.path();
        config.malware_scan = malware_scan;
        ServiceCollaborators collaborators;
        collaborators.clock = clock.clock();
        return std::make_unique<UploadService>(std::move(config), std::move(collaborators));
    }

    protocol::UploadInitRequest init_request(const std::string &artifact, const std::string &filename,
                                             std::uint64_t total, std::uint64_t chunk_size)
    {
        return protocol::UploadInitRequest{
            .artifact_id = artifact,
            .filename = filename,
            .total_size_bytes = total,
            .total_chunks = chunk_count_for(total, chunk_size),
            .chunk_size_bytes = chunk_size,
        };
    }

    protocol::UploadChunkRequest chunk_request(const std::string &session_id, const std::vector<std::byte> &data,
                                               std::uint64_t chunk_number, std::uint64_t chunk_size)
    {
        const auto offset = chunk_number * chunk_size;
        const auto length = std::min<std::uint64_t>(chunk_size, data.size() - offset);
        const auto bytes = testing::slice(data, offset, length);
        return protocol::UploadChunkRequest{
            .session_id = session_id,
            .chunk_number = chunk_number,
            .chunk_hash = crypto::sha256_hex(bytes),
            .data_base64 = encoding::encode_base64(bytes),
        };
    }

    // Opens a session and sends every chunk; returns the session id.
    std::string upload_all(UploadService &service, const std::string &artifact, const std::string &filename,
                           const std::vector<std::byte> &data, std::uint64_t chunk_size)
    {
        auto created = service.init_session(init_request(artifact, filename, data.size(), chunk_size));
        assert(created.ok());
        const auto total = chunk_count_for(data.size(), chunk_size);
        for (std::uint64_t chunk = 0; chunk < total; ++chunk)
        {
            assert(service.upload_chunk(chunk_request(created->session_id, data, chunk, chunk_size)).ok());
        }
        return created->session_id;
    }

    protocol::BatchFile batch_file(const std::string &filename, const std::vector<std::byte> &data)
    {
        return protocol::BatchFile{.filename = filename, .data_base64 = encoding::encode_base64(data)};
    }

    void test_two_chunk_upload()
    {
        testing::TempDir dir("service_two_chunks");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 5'000'000;
        const auto data = testing::make_bytes(10'000'000);

        auto created = service->init_session(init_request("resnet-50", "weights.bin", data.size(), chunk_size));
        assert(created.ok());
        assert(created->chunk_size_bytes == chunk_size);
        assert(created->upload_target == "UPLOAD_CHUNK:" + created->session_id);
        assert(created->expires_at == to_unix_seconds(clock.now() + std::chrono::hours(24)));

        auto second = service->upload_chunk(chunk_request(created->session_id, data, 1, chunk_size));
        assert(second.ok());
        assert(second->status == "received");
        assert(second->bytes_received == chunk_size);
        assert(service->upload_chunk(chunk_request(created->session_id, data, 0, chunk_size)).ok());

        // Resending an accepted chunk is harmless.
        auto resent = service->upload_chunk(chunk_request(created->session_id, data, 0, chunk_size));
        assert(resent.ok());
        assert(resent->status == "unchanged");
        assert(resent->bytes_received == data.size());

        const protocol::SessionRequest session{.session_id = created->session_id};
        auto progress = service->progress(session);
        assert(progress.ok());
        assert(progress->percent_complete == 1.0);
        assert(progress->chunks_received == 2);

        const protocol::FinalizeRequest finalize{.session_id = created->session_id,
                                                 .final_sha256 = crypto::sha256_hex(data)};
        auto finalized = service->finalize(finalize);
        assert(finalized.ok());
        assert(finalized->artifact_id == "resnet-50");
        assert(finalized->file_size_bytes == 10'000'000);
        assert(finalized->sha256_checksum == crypto::sha256_hex(data));
        assert(!finalized->deduplicated);

        auto repeated = service->finalize(finalize);
        assert(repeated.ok());
        assert(repeated->file_id == finalized->file_id);

        assert(service->upload_chunk(chunk_request(created->session_id, data, 0, chunk_size)).code() ==
               ErrorCode::SessionClosed);
        assert(service->abort(session).code() == ErrorCode::InvalidState);
    }

    void test_cross_artifact_deduplication()
    {
        testing::TempDir dir("service_dedup");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(600'000);
        const auto digest = crypto::sha256_hex(data);

        const auto first = upload_all(*service, "model-a", "w.bin", data, chunk_size);
        auto original = service->finalize({.session_id = first, .final_sha256 = digest});
        assert(original.ok());

        const auto second = upload_all(*service, "model-b", "copy.bin", data, chunk_size);
        auto duplicate = service->finalize({.session_id = second, .final_sha256 = digest});
        assert(duplicate.ok());
        assert(duplicate->deduplicated);
        assert(duplicate->artifact_id == "model-b");
        assert(duplicate->file_id == original->file_id);
        assert(service->index().size() == 1);

        auto check = service->check_duplicate({.sha256_checksum = digest});
        assert(check.ok() && check->is_duplicate);
        assert(check->existing_file_id == original->file_id);

        // A file already stored for the same artifact is not reported.
        check = service->check_duplicate({.artifact_id = std::string("model-a"), .sha256_checksum = digest});
        assert(check.ok() && !check->is_duplicate);
        check = service->check_duplicate({.artifact_id = std::string("model-c"), .sha256_checksum = digest});
        assert(check->is_duplicate);

        std::string upper = digest;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(service->check_duplicate({.sha256_checksum = upper})->is_duplicate);
        assert(!service->check_duplicate({.sha256_checksum = std::string(64, '0')})->is_duplicate);
        assert(service->check_duplicate({.sha256_checksum = "xyz"}).code() == ErrorCode::InvalidParameters);
    }

    void test_concurrent_finalize()
    {
        testing::TempDir dir("service_concurrent_finalize");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(700'000, 11);
        const auto session_id = upload_all(*service, "model-a", "w.bin", data, chunk_size);
        const protocol::FinalizeRequest request{.session_id = session_id, .final_sha256 = crypto::sha256_hex(data)};

        std::vector<std::optional<std::string>> file_ids(4);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < file_ids.size(); ++i)
        {
            threads.emplace_back([&, i]
                                 {
                auto result = service->finalize(request);
                if (result.ok())
                {
                    file_ids[i] = result->file_id;
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        for (const auto &file_id : file_ids)
        {
            assert(file_id.has_value());
            assert(*file_id == *file_ids.front());
        }
        assert(service->index().size() == 1);
        std::size_t stored_objects = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir.path() / "objects" / "model-a"))
        {
            (void)entry;
            ++stored_objects;
        }
        assert(stored_objects == 1);
    }

    void test_concurrent_chunks()
    {
        testing::TempDir dir("service_concurrent_chunks");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(8 * chunk_size - 100, 23);
        auto created = service->init_session(init_request("model-a", "w.bin", data.size(), chunk_size));
        assert(created.ok());
        const auto session_id = created->session_id;

        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for (std::uint64_t chunk = 0; chunk < 8; ++chunk)
        {
            threads.emplace_back([&, chunk]
                                 {
                // Every chunk is sent twice so duplicates race with first deliveries.
                for (int attempt = 0; attempt < 2; ++attempt)
                {
                    if (!service->upload_chunk(chunk_request(session_id, data, chunk, chunk_size)).ok())
                    {
                        ++failures;
                    }
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(failures == 0);

        auto progress = service->progress({.session_id = session_id});
        assert(progress->chunks_received == 8);
        assert(progress->bytes_received == data.size());
        assert(service->finalize({.session_id = session_id, .final_sha256 = crypto::sha256_hex(data)}).ok());
    }

    void test_abort()
    {
        testing::TempDir dir("service_abort");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(300'000);
        auto created = service->init_session(init_request("model-a", "w.bin", data.size(), chunk_size));
        assert(service->upload_chunk(chunk_request(created->session_id, data, 0, chunk_size)).ok());
        assert(service->staging().contains(created->session_id));

        const protocol::SessionRequest session{.session_id = created->session_id};
        auto aborted = service->abort(session);
        assert(aborted.ok());
        assert(aborted->status == "ABORTED");
        assert(!service->staging().contains(created->session_id));
        assert(service->abort(session).ok());

        assert(service->upload_chunk(chunk_request(created->session_id, data, 1, chunk_size)).code() ==
               ErrorCode::SessionClosed);
        assert(service->finalize({.session_id = created->session_id, .final_sha256 = crypto::sha256_hex(data)})
                   .code() == ErrorCode::InvalidState);
        assert(service->abort({.session_id = "01ARZ3NDEKTSV4RRFFQ69G5FAV"}).code() == ErrorCode::NotFound);
    }

    void test_expiry_sweep()
    {
        testing::TempDir dir("service_expiry");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(300'000);
        auto created = service->init_session(init_request("model-a", "w.bin", data.size(), chunk_size));
        assert(service->upload_chunk(chunk_request(created->session_id, data, 0, chunk_size)).ok());

        clock.advance(std::chrono::hours(24) + std::chrono::seconds(1));
        const auto report = service->sweep_expired();
        assert(report.expired == 1);
        assert(!service->staging().contains(created->session_id));

        const protocol::SessionRequest session{.session_id = created->session_id};
        assert(service->upload_chunk(chunk_request(created->session_id, data, 1, chunk_size)).code() ==
               ErrorCode::SessionExpired);
        assert(service->abort(session).code() == ErrorCode::SessionExpired);
        // Progress stays readable until the record is purged.
        assert(service->progress(session).ok());

        clock.advance(std::chrono::hours(24));
        assert(service->sweep_expired().purged == 1);
        assert(service->progress(session).code() == ErrorCode::NotFound);
    }

    void test_init_rejections()
    {
        testing::TempDir dir("service_init");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);

        auto request = init_request("model-a", "w.bin", 1'000'000, 262'144);
        request.total_chunks = 3;
        assert(service->init_session(request).code() == ErrorCode::InvalidParameters);

        assert(service->init_session(init_request("model-a", "../w.bin", 1'000'000, 262'144)).code() ==
               ErrorCode::InvalidParameters);
        assert(service->init_session(init_request("model-a", "w.bin", 1'000'000, 1024)).code() ==
               ErrorCode::InvalidParameters);
        assert(service->init_session(init_request("model-a", "w.bin", 200'000'000'000ULL, 100'000'000)).code() ==
               ErrorCode::PayloadTooLarge);
        assert(service->init_session(init_request("bad/artifact", "w.bin", 1'000'000, 262'144)).code() ==
               ErrorCode::InvalidParameters);

        request = init_request("model-a", "setup.bin", 1'000'000, 262'144);
        request.content_type = "application/x-msdownload";
        assert(service->init_session(request).code() == ErrorCode::InvalidParameters);

        // Once artifacts are registered, unknown ones are rejected.
        std::filesystem::create_directories(dir.path() / ".artistore");
        {
            std::ofstream out(dir.path() / ".artistore" / "artifacts.json");
            out << nlohmann::json::array({"model-a"}).dump();
        }
        assert(service->init_session(init_request("model-z", "w.bin", 1'000'000, 262'144)).code() ==
               ErrorCode::NotFound);
        assert(service->init_session(init_request("model-a", "w.bin", 1'000'000, 262'144)).ok());
    }

    void test_chunk_payload_errors()
    {
        testing::TempDir dir("service_chunk_errors");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(300'000);
        auto created = service->init_session(init_request("model-a", "w.bin", data.size(), chunk_size));

        auto request = chunk_request(created->session_id, data, 0, chunk_size);
        request.data_base64 = "not base64!";
        assert(service->upload_chunk(request).code() == ErrorCode::InvalidPayload);

        request = chunk_request(created->session_id, data, 0, chunk_size);
        request.chunk_hash = crypto::sha256_hex(testing::to_bytes("something else"));
        assert(service->upload_chunk(request).code() == ErrorCode::ChecksumMismatch);

        assert(service->finalize({.session_id = created->session_id, .final_sha256 = crypto::sha256_hex(data)})
                   .code() == ErrorCode::IncompleteUpload);
    }

    void test_validate_file()
    {
        testing::TempDir dir("service_validate");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);

        const auto config = testing::to_bytes("{\"epochs\": 10}");
        auto report = service->validate_file({.filename = "config.json",
                                              .data_base64 = encoding::encode_base64(config)});
        assert(report.ok());
        assert(report->passed);
        assert(!report->reason.has_value());
        assert(report->results.size() == 5);
        assert(report->warnings.empty());

        const auto script = testing::to_bytes("result = eval(user_input)\n");
        report = service->validate_file({.filename = "notes.txt", .data_base64 = encoding::encode_base64(script)});
        assert(!report->passed);
        assert(report->failed_check == "malware");
        assert(report->reason.has_value());

        // Shell and JavaScript sources are allowed and skip the keyword heuristics.
        const auto setup = testing::to_bytes("#!/bin/bash\nset -e\nexec python train.py \"$@\"\n");
        report = service->validate_file({.filename = "setup.sh", .data_base64 = encoding::encode_base64(setup)});
        assert(report.ok());
        assert(report->passed);
        assert(report->results.size() == 5);
        const auto loader = testing::to_bytes("const tf = require('tfjs');\neval(modelSource);\n");
        report = service->validate_file({.filename = "loader.js", .data_base64 = encoding::encode_base64(loader)});
        assert(report->passed);
        report = service->validate_file({.filename = "setup.txt", .data_base64 = encoding::encode_base64(setup)});
        assert(report->failed_check == "malware");

        assert(service->validate_file({.filename = "a.txt", .data_base64 = "%%%"}).code() ==
               ErrorCode::InvalidPayload);

        testing::TempDir unscanned_dir("service_validate_unscanned");
        auto unscanned = make_service(unscanned_dir, clock, false);
        assert(unscanned->validate_file({.filename = "notes.txt", .data_base64 = encoding::encode_base64(script)})
                   ->passed);
    }

    void test_code_tarball_finalizes()
    {
        testing::TempDir dir("service_code_tarball");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const std::uint64_t chunk_size = 300'000;
        std::vector<std::byte> data(600'000, std::byte{0});
        const std::string header = "code/run.py";
        const std::string source = "import subprocess\nsubprocess.run(['make', 'data'])\nos.system('ls')\n";
        std::copy_n(reinterpret_cast<const std::byte *>(header.data()), header.size(), data.begin());
        std::copy_n(reinterpret_cast<const std::byte *>(source.data()), source.size(), data.begin() + 512);

        const auto session_id = upload_all(*service, "model-a", "code.tar", data, chunk_size);
        auto finalized = service->finalize({.session_id = session_id, .final_sha256 = crypto::sha256_hex(data)});
        assert(finalized.ok());
        assert(finalized->file_size_bytes == data.size());
        assert(!finalized->deduplicated);

        // The same bytes still fail an explicit whole-file validation.
        auto report = service->validate_file({.filename = "code.tar",
                                              .data_base64 = encoding::encode_base64(testing::slice(data, 0, 4096))});
        assert(report.ok());
        assert(report->failed_check == "malware");
    }

    void test_batch_upload()
    {
        testing::TempDir dir("service_batch");
        testing::ManualClock clock;
        auto service = make_service(dir, clock);
        const auto readme = testing::to_bytes("model card\n");
        const auto labels = testing::to_bytes("cat,dog\n");

        protocol::BatchUploadRequest request{
            .artifact_id = "model-a",
            .files = {batch_file("README.md", readme), batch_file("labels.csv", labels)},
        };
        auto batch = service->upload_batch(request);
        assert(batch.ok());
        assert(batch->total_files == 2);
        assert(batch->successful_count == 2);
        assert(batch->failed_count == 0);
        assert(batch->results[0].success);
        assert(batch->results[0].sha256_checksum == crypto::sha256_hex(readme));
        assert(service->index().size() == 2);
        const auto readme_id = batch->results[0].file_id;

        // Without skipping, a duplicate resolves to the stored file.
        request.files = {batch_file("README.md", readme)};
        batch = service->upload_batch(request);
        assert(batch->results[0].success);
        assert(batch->results[0].file_id == readme_id);

        request.skip_duplicates = true;
        batch = service->upload_batch(request);
        assert(batch->failed_count == 1);
        assert(batch->results[0].error_message == "Duplicate file skipped");

        request.skip_duplicates = false;
        request.stop_on_error = true;
        request.files = {protocol::BatchFile{.filename = "broken.txt", .data_base64 = "@@@"},
                         batch_file("other.txt", testing::to_bytes("other\n"))};
        batch = service->upload_batch(request);
        assert(batch->results.size() == 1);
        assert(batch->failed_count == 1);
        assert(batch->results[0].error_message == "File data is not valid base64");

        request.stop_on_error = false;
        request.files = {batch_file("evil.txt", testing::to_bytes("os.system('rm')\n")),
                         batch_file("fine.txt", testing::to_bytes("fine\n"))};
        batch = service->upload_batch(request);
        assert(batch->results.size() == 2);
        assert(!batch->results[0].success);
        assert(batch->results[0].error_message->starts_with("malware"));
        assert(batch->results[1].success);

        request.files.clear();
        assert(service->upload_batch(request).code() == ErrorCode::InvalidParameters);
    }

    void test_restart_resumes_session()
    {
        testing::TempDir dir("service_restart");
        testing::ManualClock clock;
        const std::uint64_t chunk_size = 262'144;
        const auto data = testing::make_bytes(500'000, 3);
        std::string session_id;
        {
            auto service = make_service(dir, clock);
            auto created = service->init_session(init_request("model-a", "w.bin", data.size(), chunk_size));
            session_id = created->session_id;
            assert(service->upload_chunk(chunk_request(session_id, data, 0, chunk_size)).ok());
        }

        auto service = make_service(dir, clock);
        auto progress = service->progress({.session_id = session_id});
        assert(progress.ok());
        assert(progress->chunks_received == 1);
        assert(progress->bytes_received == chunk_size);

        assert(service->upload_chunk(chunk_request(session_id, data, 1, chunk_size)).ok());
        auto finalized = service->finalize({.session_id = session_id, .final_sha256 = crypto::sha256_hex(data)});
        assert(finalized.ok());
        assert(finalized->file_size_bytes == data.size());
    }

} // namespace

void run_upload_service_tests()
{
    test_two_chunk_upload();
    test_cross_artifact_deduplication();
    test_concurrent_finalize();
    test_concurrent_chunks();
    test_abort();
    test_expiry_sweep();
    test_init_rejections();
    test_chunk_payload_errors();
    test_validate_file();
    test_code_tarball_finalizes();
    test_batch_upload();
    test_restart_resumes_session();
}
