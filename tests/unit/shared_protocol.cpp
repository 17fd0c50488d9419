#include <array>
#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "chunkvault/byte_order.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/version.hpp"

#include "test_support.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;
using chunkvault::testing::capture_protocol_error;

void run_server_component_tests();
void run_dispatcher_tests();
void run_loopback_tests();

namespace
{

    void test_byte_order()
    {
        wire::ByteWriter writer;
        writer.u8(0xAB).u16(0x0102).u32(0x03040506).u64(0x0708090A0B0C0D0EULL).string16("hi").string8("ok");
        const auto bytes = writer.take();
        assert(bytes.size() == 1 + 2 + 4 + 8 + 4 + 3);
        assert(bytes[0] == 0xAB);
        assert(bytes[1] == 0x01 && bytes[2] == 0x02);
        assert(bytes[3] == 0x03 && bytes[6] == 0x06);

        wire::ByteReader reader(bytes, "test");
        assert(reader.u8() == 0xAB);
        assert(reader.u16() == 0x0102);
        assert(reader.u32() == 0x03040506);
        assert(reader.u64() == 0x0708090A0B0C0D0EULL);
        assert(reader.string16() == "hi");
        assert(reader.string8() == "ok");
        assert(reader.remaining() == 0);

        const auto error = capture_protocol_error([&]
                                                  { reader.u32(); });
        assert(error);
        assert(error->code() == ErrorCode::MalformedEnvelope);
        assert(std::string(error->what()).find("Invalid test") == 0);

        bool threw = false;
        try
        {
            wire::ByteWriter oversized;
            oversized.string8(std::string(256, 'x'));
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_envelope_framing()
    {
        const std::vector<std::uint8_t> payload{0x00, 0x01, 0x02};
        const auto frame = encode_envelope("secret", to_byte(Command::GetStatus), payload);

        // authTokenLen | token | payloadLen | command | payload
        assert(frame.size() == 4 + 6 + 4 + 1 + 3);
        assert(wire::read_u32_be(std::span(frame).first<4>()) == 6);
        assert(wire::read_u32_be(std::span(frame).subspan(10).first<4>()) == 4);
        assert(frame[14] == 0x06);

        for (std::size_t cut = 0; cut < frame.size(); ++cut)
        {
            assert(!try_decode_frame(std::span(frame).first(cut)));
        }

        auto doubled = frame;
        doubled.insert(doubled.end(), frame.begin(), frame.end());
        const auto decoded = try_decode_frame(doubled);
        assert(decoded);
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->auth_token == "secret");

        const auto envelope = make_envelope(decoded->auth_token, decoded->body);
        assert(envelope.command == to_byte(Command::GetStatus));
        assert(envelope.payload == payload);

        const auto empty = capture_protocol_error([]
                                                  { make_envelope("t", {}); });
        assert(empty && empty->code() == ErrorCode::MalformedEnvelope);
    }

    void test_frame_limits()
    {
        FrameLimits limits{.max_token_size = 8, .max_body_size = 16};

        const auto long_token = encode_envelope(std::string(9, 't'), 0x01, {});
        const auto token_error = capture_protocol_error([&]
                                                        { try_decode_frame(std::span(long_token).first(4), limits); });
        assert(token_error);
        assert(std::string(token_error->what()) == "Invalid auth token size");

        const std::vector<std::uint8_t> big(32, 0);
        const auto long_body = encode_envelope("tok", 0x02, big);
        const auto body_error = capture_protocol_error([&]
                                                       { try_decode_frame(std::span(long_body).first(11), limits); });
        assert(body_error);
        assert(std::string(body_error->what()) == "Invalid payload size");
    }

    void test_request_codec()
    {
        const auto init_payload = encode_payload(InitUploadRequest{"movie.mp4", 3, 1048576});
        const auto init = decode_init_upload(init_payload);
        assert(init.filename == "movie.mp4");
        assert(init.total_chunks == 3);
        assert(init.chunk_size == 1048576);

        const auto chunk_payload = encode_payload(UploadChunkRequest{"alice_0011", 7, {1, 2, 3, 4}});
        const auto chunk = decode_upload_chunk(chunk_payload);
        assert(chunk.session_id == "alice_0011");
        assert(chunk.chunk_index == 7);
        assert((chunk.data == std::vector<std::uint8_t>{1, 2, 3, 4}));

        const auto session = decode_session_request(Command::PauseUpload, encode_payload(SessionRequest{"s-1"}));
        assert(session.session_id == "s-1");

        // Trailing bytes after the declared fields are ignored.
        auto padded = encode_payload(SessionRequest{"s-2"});
        padded.push_back(0xFF);
        assert(decode_session_request(Command::GetStatus, padded).session_id == "s-2");
    }

    void test_malformed_requests()
    {
        auto init_payload = encode_payload(InitUploadRequest{"a.mp4", 1, 10});
        init_payload.resize(init_payload.size() - 2);
        const auto truncated = capture_protocol_error([&]
                                                      { decode_init_upload(init_payload); });
        assert(truncated);
        assert(truncated->code() == ErrorCode::MalformedEnvelope);
        assert(std::string(truncated->what()) == "Invalid INIT_UPLOAD: incomplete u32 field");

        // Declared data length larger than what follows.
        wire::ByteWriter writer;
        writer.string16("s").u32(0).u32(100).u8(1);
        const auto short_chunk = writer.take();
        const auto chunk_error = capture_protocol_error([&]
                                                        { decode_upload_chunk(short_chunk); });
        assert(chunk_error && chunk_error->code() == ErrorCode::MalformedEnvelope);

        const std::vector<std::uint8_t> one_byte{0x00};
        const auto session_error = capture_protocol_error([&]
                                                          { decode_session_request(Command::CancelUpload, one_byte); });
        assert(session_error);
        assert(std::string(session_error->what()).find("CANCEL_UPLOAD") != std::string::npos);
    }

    void test_response_codec()
    {
        const std::vector<Response> responses{
            ReadyResponse{"alice_1", "alice/20240101_000000/a.mp4"},
            ChunkAckResponse{0, 1, 3},
            DuplicateResponse{0, 1},
            CompleteResponse{"alice/20240101_000000/a.mp4", 3145728},
            PausedResponse{2, 5},
            ResumedResponse{2, 5, {2, 3, 4}},
            CancelledResponse{},
            StatusResponse{"uploading", 2, 5},
            ErrorResponse{"session not found"},
            AuthFailedResponse{},
        };

        std::vector<std::uint8_t> stream;
        for (const auto &response : responses)
        {
            const auto bytes = encode_response(response);
            assert(bytes.front() == static_cast<std::uint8_t>(response_code(response)));
            stream.insert(stream.end(), bytes.begin(), bytes.end());
        }

        // Responses are self-delimiting: decode them back to back from one buffer.
        std::span<const std::uint8_t> rest(stream);
        for (const auto &expected : responses)
        {
            const auto decoded = try_decode_response(rest);
            assert(decoded);
            assert(decoded->response.index() == expected.index());
            rest = rest.subspan(decoded->bytes_consumed);
        }
        assert(rest.empty());

        const auto resumed = encode_response(ResumedResponse{2, 5, {2, 3, 4}});
        assert(resumed.size() == 1 + 12 + 12);
        const auto decoded = try_decode_response(resumed);
        const auto &body = std::get<ResumedResponse>(decoded->response);
        assert((body.missing_chunks == std::vector<std::uint32_t>{2, 3, 4}));
        assert(!try_decode_response(std::span(resumed).first(resumed.size() - 1)));

        const auto complete = encode_response(CompleteResponse{"k", 42});
        const auto &done = std::get<CompleteResponse>(try_decode_response(complete)->response);
        assert(done.storage_key == "k" && done.final_size == 42);
    }

    void test_error_response_truncation()
    {
        const auto bytes = encode_response(ErrorResponse{std::string(400, 'e')});
        assert(bytes.size() == 2 + 255);
        assert(bytes[1] == 255);
        const auto decoded = try_decode_response(bytes);
        assert(std::get<ErrorResponse>(decoded->response).message.size() == 255);

        const std::vector<std::uint8_t> unknown{0x7F};
        const auto error = capture_protocol_error([&]
                                                  { try_decode_response(unknown); });
        assert(error);
    }

    void test_code_tables()
    {
        assert(to_string(Command::InitUpload) == "INIT_UPLOAD");
        assert(command_from_byte(0x05) == Command::CancelUpload);
        assert(!command_from_byte(0x07));
        assert(to_string(ResponseCode::Duplicate) == "DUPLICATE");
        assert(response_code_from_byte(0x19) == ResponseCode::AuthFailed);
        assert(to_string(ErrorCode::SessionNotFound) == "session_not_found");
        assert(default_message(ErrorCode::SessionClosed) == "session closed");
        assert(to_string(ErrorCode::InvalidFilename) == "invalid_filename");
        assert(!version().empty());
    }

    void test_crypto()
    {
        const std::array<std::uint8_t, 4> chunk = {0xDE, 0xAD, 0xBE, 0xEF};
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        assert(crypto::hash_text(std::string("\xDE\xAD\xBE\xEF", 4)) == chunk_hash);

        crypto::Digest pieces;
        pieces.update(std::span(chunk).first(1)).update(std::string_view("\xAD\xBE", 2));
        pieces.update(std::span(chunk).last(1));
        assert(pieces.hex() == chunk_hash);
        bool threw = false;
        try
        {
            pieces.update(std::string_view("x"));
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto a = crypto::random_hex(8);
        const auto b = crypto::random_hex(8);
        assert(a.size() == 16);
        assert(a != b);
    }

} // namespace

int main()
{
    try
    {
        test_byte_order();
        test_envelope_framing();
        test_frame_limits();
        test_request_codec();
        test_malformed_requests();
        test_response_codec();
        test_error_response_truncation();
        test_code_tables();
        test_crypto();
        run_server_component_tests();
        run_dispatcher_tests();
        run_loopback_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
