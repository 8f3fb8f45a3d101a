#include <array>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "artistore/crypto.hpp"
#include "artistore/encoding/base64.hpp"
#include "artistore/error_codes.hpp"
#include "artistore/framing.hpp"
#include "artistore/identifiers.hpp"
#include "artistore/protocol.hpp"
#include "test_support.hpp"

using namespace artistore;
using namespace artistore::protocol;

void run_server_component_tests();
void run_upload_service_tests();

namespace
{

    void test_request_envelope()
    {
        UploadInitRequest init{
            .artifact_id = "resnet-50",
            .filename = "weights.bin",
            .total_size_bytes = 10'000'000,
            .total_chunks = 2,
            .chunk_size_bytes = 5'000'000,
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadInit;
        envelope.payload = init;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_INIT");
        assert(json.at("id") == "req-42");
        assert(!json.at("payload").contains("content_type"));

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::UploadInit);
        assert(decoded.request_id == envelope.request_id);
        const auto payload = decoded.payload.get<UploadInitRequest>();
        assert(payload.total_chunks == 2);
        assert(!payload.content_type.has_value());

        bool rejected = false;
        try
        {
            (void)nlohmann::json{{"cmd", "LIST"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_response_envelope()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::SessionExpired;
        envelope.status_code = status_code(ErrorCode::SessionExpired);
        envelope.message = "expired";

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("code") == 410);
        assert(json.at("error") == to_int(ErrorCode::SessionExpired));
        assert(!json.contains("id"));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::SessionExpired);
        assert(decoded.status_code == 410);
        assert(decoded.message == "expired");

        // A response without "code" falls back to the code's status.
        const auto legacy = nlohmann::json{{"status", "ERROR"}, {"error", to_int(ErrorCode::NotFound)}}
                                .get<ResponseEnvelope>();
        assert(legacy.status_code == 404);
    }

    void test_upload_payloads()
    {
        UploadChunkRequest chunk{
            .session_id = "01HZX",
            .chunk_number = 3,
            .chunk_hash = std::string(64, 'a'),
            .data_base64 = "Zm9v",
        };
        const auto chunk_json = nlohmann::json(chunk);
        assert(chunk_json.at("data") == "Zm9v");
        assert(chunk_json.get<UploadChunkRequest>().chunk_number == 3);

        ProgressResponse progress{
            .bytes_received = 5,
            .bytes_remaining = 5,
            .chunks_received = 1,
            .total_chunks = 2,
            .percent_complete = 0.5,
        };
        auto progress_json = nlohmann::json(progress);
        assert(!progress_json.contains("eta_seconds"));
        progress.eta_seconds = 12.5;
        progress_json = nlohmann::json(progress);
        assert(progress_json.get<ProgressResponse>().eta_seconds == 12.5);

        DuplicateCheckResponse duplicate{.is_duplicate = false};
        const auto duplicate_json = nlohmann::json(duplicate);
        assert(duplicate_json.get<DuplicateCheckResponse>().existing_file_id == std::nullopt);

        const auto batch = nlohmann::json{{"artifact_id", "a"}, {"files", nlohmann::json::array()}}
                               .get<BatchUploadRequest>();
        assert(!batch.skip_duplicates);
        assert(!batch.stop_on_error);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"hello", "world"}};
        const auto frame = encode_frame(message);
        assert(frame.size() == kFrameHeaderSize + message.dump().size());
        assert(decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize)) ==
               message.dump().size());

        // Incomplete buffers yield nothing until the whole payload arrives.
        assert(!try_decode_frame(std::span(frame.data(), 3), 1024).has_value());
        assert(!try_decode_frame(std::span(frame.data(), frame.size() - 1), 1024).has_value());

        const auto decoded = try_decode_frame(frame, 1024);
        assert(decoded.has_value());
        assert(decoded->message == message);
        assert(decoded->bytes_consumed == frame.size());

        bool too_large = false;
        try
        {
            (void)try_decode_frame(frame, 4);
        }
        catch (const FrameTooLarge &ex)
        {
            too_large = ex.size() == message.dump().size();
        }
        assert(too_large);
    }

    void test_crypto()
    {
        const auto abc = testing::to_bytes("abc");
        assert(crypto::sha256_hex(abc) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(crypto::sha256_hex({}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        assert(crypto::fast_checksum(abc).size() == crypto::kFastChecksumBytes * 2);
        assert(crypto::fast_checksum(abc) != crypto::fast_checksum(testing::to_bytes("abd")));

        // Streaming in pieces matches the one-shot digest.
        const auto data = testing::make_bytes(100'000);
        crypto::DualHasher hasher;
        hasher.update(testing::slice(data, 0, 40'000));
        hasher.update(testing::slice(data, 40'000, 60'000));
        const auto digests = hasher.finish();
        assert(digests.bytes == data.size());
        assert(digests.sha256 == crypto::sha256_hex(data));
        assert(digests.fast == crypto::fast_checksum(data));

        std::istringstream stream(std::string(reinterpret_cast<const char *>(data.data()), data.size()));
        assert(crypto::hash_stream(stream).sha256 == digests.sha256);

        assert(crypto::is_sha256_hex(digests.sha256));
        assert(!crypto::is_sha256_hex(digests.sha256.substr(1)));
        assert(!crypto::is_sha256_hex(std::string(64, 'g')));
        assert(crypto::normalize_digest("ABCDEF") == "abcdef");

        const auto hash = crypto::hash_password("correct horse");
        assert(crypto::verify_password("correct horse", hash));
        assert(!crypto::verify_password("wrong horse", hash));
    }

    void test_base64()
    {
        assert(encoding::encode_base64(testing::to_bytes("foobar")) == "Zm9vYmFy");
        assert(encoding::encode_base64(testing::to_bytes("fo")) == "Zm8=");
        const auto decoded = encoding::decode_base64("Zm9vYg==");
        assert(decoded.has_value());
        assert(*decoded == testing::to_bytes("foob"));
        assert(!encoding::decode_base64("Zm9v!!").has_value());
        assert(encoding::decode_base64("")->empty());
    }

    void test_identifiers()
    {
        const auto now = std::chrono::system_clock::now();
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i)
        {
            const auto id = generate_ulid(now);
            assert(id.size() == 26);
            assert(is_ulid(id));
            seen.insert(id);
        }
        assert(seen.size() == 100);

        // The timestamp prefix orders identifiers by creation time.
        const auto earlier = generate_ulid(now);
        const auto later = generate_ulid(now + std::chrono::seconds(1));
        assert(earlier.substr(0, 10) < later.substr(0, 10));

        assert(!is_ulid("not-a-ulid"));
        assert(!is_ulid(std::string(26, 'U')));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::IncompleteUpload) == "incomplete_upload");
        assert(status_code(ErrorCode::IncompleteUpload) == 409);
        assert(status_code(ErrorCode::PayloadTooLarge) == 413);
        assert(status_code(ErrorCode::NotFound) == 404);
        assert(status_code(ErrorCode::AuthenticationRequired) == 403);
        assert(to_string(ErrorCode::SessionClosed) == "session_closed");
        assert(status_code(ErrorCode::SessionClosed) == 410);
        assert(error_code_from_int(to_int(ErrorCode::ChecksumMismatch)) == ErrorCode::ChecksumMismatch);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

} // namespace

int main()
{
    try
    {
        test_request_envelope();
        test_response_envelope();
        test_upload_payloads();
        test_framing();
        test_crypto();
        test_base64();
        test_identifiers();
        test_error_codes();
        run_server_component_tests();
        run_upload_service_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
