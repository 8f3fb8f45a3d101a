#include "artistore/client/session.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

#include "artistore/encoding/base64.hpp"
#include "artistore/protocol.hpp"

namespace artistore::client
{

    namespace
    {

        std::optional<std::string> read_file_base64(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                return std::nullopt;
            }
            const std::vector<char> contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            return artistore::encoding::encode_base64(std::as_bytes(std::span(contents.data(), contents.size())));
        }

        void print_usage_error(const std::string &usage)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: " << usage << std::endl;
        }

    } // namespace

    bool ClientSession::handle_progress(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage_error("PROGRESS <session_id>");
            return true;
        }
        artistore::protocol::SessionRequest request{.session_id = args[0]};
        auto response = rpc(artistore::protocol::Command::UploadProgress, request);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto progress = response.payload.get<artistore::protocol::ProgressResponse>();
        std::cout << std::fixed << std::setprecision(1) << progress.percent_complete * 100.0 << "% "
                  << progress.chunks_received << "/" << progress.total_chunks << " chunks, "
                  << progress.bytes_received << " bytes received, " << std::setprecision(2) << progress.speed_mbps
                  << " MB/s";
        if (progress.eta_seconds)
        {
            std::cout << ", eta " << std::setprecision(0) << *progress.eta_seconds << "s";
        }
        std::cout << std::defaultfloat << std::endl;
        return true;
    }

    bool ClientSession::handle_abort(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage_error("ABORT <session_id>");
            return true;
        }
        artistore::protocol::SessionRequest request{.session_id = args[0]};
        auto response = rpc(artistore::protocol::Command::UploadAbort, request);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        state_store_.remove_session(args[0]);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool ClientSession::handle_check(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            print_usage_error("CHECK <sha256> [artifact_id]");
            return true;
        }
        artistore::protocol::DuplicateCheckRequest request{.sha256_checksum = args[0]};
        if (args.size() == 2)
        {
            request.artifact_id = args[1];
        }
        auto response = rpc(artistore::protocol::Command::CheckDuplicate, request);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto result = response.payload.get<artistore::protocol::DuplicateCheckResponse>();
        if (result.is_duplicate)
        {
            std::cout << "Duplicate of " << result.existing_file_id.value_or("?") << std::endl;
        }
        else
        {
            std::cout << "Not stored yet" << std::endl;
        }
        return true;
    }

    bool ClientSession::handle_validate(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            print_usage_error("VALIDATE <local_path> [content_type]");
            return true;
        }
        const std::filesystem::path path(args[0]);
        auto data = read_file_base64(path);
        if (!data)
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            return true;
        }
        artistore::protocol::ValidateFileRequest request{
            .filename = path.filename().string(),
            .data_base64 = std::move(*data),
        };
        if (args.size() == 2)
        {
            request.content_type = args[1];
        }
        auto response = rpc(artistore::protocol::Command::ValidateFile, request);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto report = response.payload.get<artistore::protocol::ValidateFileResponse>();
        for (const auto &entry : report.results)
        {
            const char *verdict = !entry.passed ? "FAIL" : (entry.warning ? "WARN" : "PASS");
            std::cout << "  " << std::left << std::setw(10) << entry.check << verdict << "  " << entry.message
                      << std::endl;
        }
        std::cout << (report.passed ? "Valid" : "Invalid: " + report.reason.value_or("")) << std::endl;
        return true;
    }

    bool ClientSession::handle_batch(const std::vector<std::string> &args)
    {
        const std::string usage = "BATCH <artifact_id> [--skip-duplicates] [--stop-on-error] <files...>";
        if (args.size() < 2)
        {
            print_usage_error(usage);
            return true;
        }
        artistore::protocol::BatchUploadRequest request{.artifact_id = args[0]};
        for (std::size_t i = 1; i < args.size(); ++i)
        {
            if (args[i] == "--skip-duplicates")
            {
                request.skip_duplicates = true;
                continue;
            }
            if (args[i] == "--stop-on-error")
            {
                request.stop_on_error = true;
                continue;
            }
            const std::filesystem::path path(args[i]);
            auto data = read_file_base64(path);
            if (!data)
            {
                std::cout << "ERROR: file_not_found" << std::endl;
                std::cout << path.generic_string() << std::endl;
                return true;
            }
            request.files.push_back(artistore::protocol::BatchFile{
                .filename = path.filename().string(),
                .data_base64 = std::move(*data),
            });
        }
        if (request.files.empty())
        {
            print_usage_error(usage);
            return true;
        }

        auto response = rpc(artistore::protocol::Command::UploadBatch, request);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto batch = response.payload.get<artistore::protocol::BatchUploadResponse>();
        for (const auto &result : batch.results)
        {
            if (result.success)
            {
                std::cout << "  OK    " << result.filename << " -> " << result.file_id.value_or("") << std::endl;
            }
            else
            {
                std::cout << "  FAIL  " << result.filename << ": " << result.error_message.value_or("") << std::endl;
            }
        }
        std::cout << "Batch " << batch.batch_id << ": " << batch.successful_count << " stored, "
                  << batch.failed_count << " failed" << std::endl;
        return true;
    }

    bool ClientSession::handle_ping()
    {
        const auto started = std::chrono::steady_clock::now();
        auto response = rpc(artistore::protocol::Command::Ping);
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        std::cout << "PONG " << elapsed.count() << "ms" << std::endl;
        return true;
    }

} // namespace artistore::client
