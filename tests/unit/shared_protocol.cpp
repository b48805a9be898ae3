#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;

void run_server_component_tests();
void run_upload_flow_tests();
void run_session_io_tests();

namespace
{

    std::vector<std::byte> as_bytes(const std::string &text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

    void test_sha256_vectors()
    {
        assert(crypto::hash_bytes({}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        assert(crypto::hash_bytes(as_bytes("abc")) ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(crypto::hash_bytes(as_bytes("abc")).size() == crypto::kDigestHexLength);
    }

    void test_crypto_stream_and_file()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "chunkvault_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        // Larger than one read buffer.
        const std::string big(200 * 1024, 'x');
        std::istringstream big_stream(big);
        assert(crypto::hash_stream(big_stream) == crypto::hash_bytes(as_bytes(big)));

        bool caught = false;
        try
        {
            (void)crypto::hash_file(temp_dir / "chunkvault_missing_file.bin");
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_digest_comparison()
    {
        const std::string lower = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
        const std::string upper = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
        assert(crypto::digests_equal(lower, upper));
        assert(!crypto::digests_equal(lower, lower.substr(0, 63)));
        assert(!crypto::digests_equal(lower, std::string(64, '0')));
    }

    void test_base64()
    {
        using encoding::decode_base64;
        using encoding::encode_base64;

        assert(encode_base64(as_bytes("Man")) == "TWFu");
        assert(encode_base64(as_bytes("Ma")) == "TWE=");
        assert(encode_base64(as_bytes("M")) == "TQ==");
        assert(encode_base64({}).empty());

        const auto decoded = decode_base64("TWE=");
        assert(decoded.has_value());
        assert(*decoded == as_bytes("Ma"));

        const auto wrapped = decode_base64("TWFu\nTWFu");
        assert(wrapped.has_value());
        assert(*wrapped == as_bytes("ManMan"));

        assert(!decode_base64("TW@u").has_value());
        assert(!decode_base64("TWE").has_value());
        assert(!decode_base64("TQ==TQ==").has_value());
        assert(!decode_base64("T===").has_value());

        std::vector<std::byte> binary(256);
        for (std::size_t i = 0; i < binary.size(); ++i)
        {
            binary[i] = static_cast<std::byte>(i);
        }
        const auto back = decode_base64(encode_base64(binary));
        assert(back.has_value() && *back == binary);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::IntegrityMismatch) == "integrity_mismatch");
        assert(to_string(ErrorCode::MissingChunks) == "missing_chunks");
        assert(error_code_from_int(to_int(ErrorCode::TransientIo)) == ErrorCode::TransientIo);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_request_envelope()
    {
        UploadStartRequest start{
            .file_id = "f-1",
            .filename = "movie.mkv",
            .total_chunks = 4,
            .file_size = 4'000'000,
            .file_hash = std::string(64, 'a'),
            .owner_id = "alice",
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadStart;
        envelope.payload = start;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_START");
        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::UploadStart);
        assert(decoded.request_id == envelope.request_id);
        const auto decoded_start = decoded.payload.get<UploadStartRequest>();
        assert(decoded_start.total_chunks == 4);
        assert(decoded_start.owner_id == "alice");

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "LIST"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_response_envelope()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::MissingChunks;
        envelope.message = "Missing chunks: [2]";
        envelope.payload = nlohmann::json{{"missing", {2}}};

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::MissingChunks);
        assert(decoded.payload == envelope.payload);
        assert(!decoded.request_id.has_value());
    }

    void test_chunk_payloads()
    {
        UploadChunkRequest chunk{
            .file_id = "f-2",
            .owner_id = "bob",
            .chunk_index = 7,
            .data_base64 = "ZGF0YQ==",
            .chunk_hash = "abcd",
            .attempt = 2,
        };
        const auto json = nlohmann::json(chunk);
        assert(json.at("data") == "ZGF0YQ==");
        const auto decoded = json.get<UploadChunkRequest>();
        assert(decoded.chunk_index == 7);
        assert(decoded.attempt == 2);

        UploadStatusResponse status{
            .file_id = "f-2",
            .uploaded_chunks = {0, 1},
            .missing_chunks = {2},
            .total_chunks = 3,
            .progress = 66.7,
            .status = SessionStatus::Uploading,
            .recommendations = Recommendations{.chunk_size = 262144, .concurrent_uploads = 1, .network_stable = false},
        };
        const auto status_json = nlohmann::json(status);
        assert(status_json.at("status") == "uploading");
        const auto decoded_status = status_json.get<UploadStatusResponse>();
        assert(decoded_status.missing_chunks == std::vector<std::uint32_t>{2});
        assert(decoded_status.recommendations.chunk_size == 262144);
        assert(!decoded_status.recommendations.network_stable);
    }

    void test_progress_event_json()
    {
        ProgressEvent event{};
        event.type = ProgressEventType::ChunkFailed;
        event.file_id = "f-3";
        event.chunk_index = 5;
        event.total_chunks = 10;
        event.retry_recommended = true;
        event.recommended_chunk_size = 524288;
        event.timestamp_ms = 1700000000000;

        const auto json = nlohmann::json(event);
        assert(json.at("type") == "chunk_failed");
        assert(!json.contains("file_path"));
        const auto decoded = json.get<ProgressEvent>();
        assert(decoded.chunk_index == std::optional<std::uint32_t>(5));
        assert(decoded.retry_recommended == std::optional<bool>(true));
        assert(!decoded.concurrent_allowed.has_value());
        assert(decoded.timestamp_ms == event.timestamp_ms);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::UploadStatus;
        envelope.payload = FileRequest{.file_id = "f-4", .owner_id = "carol"};

        const auto frame = encode_frame(nlohmann::json(envelope));
        assert(read_frame_size(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize)) ==
               frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::UploadStatus);
        assert(decoded_envelope.payload == envelope.payload);

        const std::array<std::uint8_t, 4> oversized = {0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)try_decode_frame(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

} // namespace

int main()
{
    try
    {
        test_sha256_vectors();
        test_crypto_stream_and_file();
        test_digest_comparison();
        test_base64();
        test_error_codes();
        test_request_envelope();
        test_response_envelope();
        test_chunk_payloads();
        test_progress_event_json();
        test_framing();
        run_server_component_tests();
        run_upload_flow_tests();
        run_session_io_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
