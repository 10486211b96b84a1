// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sdcp_codec.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace sdcpwatch;
using Catch::Approx;

namespace {

const char* STATUS_MESSAGE = R"({
    "Status": {
        "CurrentStatus": [1],
        "PreviousStatus": 0,
        "TempOfHotbed": 60.12,
        "TempOfNozzle": 210.5,
        "PrintInfo": {
            "Status": 13,
            "CurrentLayer": 120,
            "TotalLayer": 400,
            "CurrentTicks": 3000,
            "TotalTicks": 6000,
            "Filename": "benchy.gcode",
            "TaskId": "6f1b"
        }
    },
    "MainboardID": "000000000001d354",
    "TimeStamp": 1735000000,
    "Topic": "sdcp/status/000000000001d354"
})";

const char* DISCOVERY_REPLY = R"({
    "Id": "f25273b12b094c5a8b9513a30ca60049",
    "Data": {
        "Name": "Centauri Carbon",
        "MachineName": "Centauri Carbon",
        "BrandName": "ELEGOO",
        "MainboardIP": "192.168.1.50",
        "MainboardID": "000000000001d354",
        "ProtocolVersion": "V3.0.0",
        "FirmwareVersion": "V1.1.29"
    }
})";

codec::StatusResult status_of(const std::string& text) {
    auto decoded = codec::decode_envelope(text, codec::EnvelopeKind::STATUS_MESSAGE);
    REQUIRE(decoded.ok());
    return codec::extract_status(decoded.envelope);
}

} // namespace

// ============================================================================
// Status request encoding
// ============================================================================

TEST_CASE("encode_status_request: envelope layout", "[codec]") {
    std::string text =
        codec::encode_status_request("f25273b12b094c5a", "000000000001d354", 1735000000);
    json j = json::parse(text);

    REQUIRE(j["Id"] == "f25273b12b094c5a");
    REQUIRE(j["Topic"] == "sdcp/request/000000000001d354");

    const json& data = j["Data"];
    REQUIRE(data["Cmd"] == 0);
    REQUIRE(data["Data"].is_object());
    REQUIRE(data["Data"].empty());
    REQUIRE(data["MainboardID"] == "000000000001d354");
    REQUIRE(data["TimeStamp"] == 1735000000);
    REQUIRE(data["From"] == 0);

    std::string request_id = data["RequestID"].get<std::string>();
    REQUIRE(request_id.size() == 16);
    REQUIRE(request_id.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("encode_status_request: fresh request id each time", "[codec]") {
    std::set<std::string> ids;
    for (int i = 0; i < 50; i++) {
        json j = json::parse(codec::encode_status_request("a", "b", 0));
        ids.insert(j["Data"]["RequestID"].get<std::string>());
    }
    REQUIRE(ids.size() == 50);
}

TEST_CASE("encode_status_request: stamps current time", "[codec]") {
    json j = json::parse(codec::encode_status_request("a", "b"));
    REQUIRE(j["Data"]["TimeStamp"].get<int64_t>() > 1700000000);
}

// ============================================================================
// decode_envelope()
// ============================================================================

TEST_CASE("decode_envelope: recovers an encoded status request", "[codec]") {
    std::string text =
        codec::encode_status_request("f25273b12b094c5a", "000000000001d354", 1735000000);

    for (auto kind : {codec::EnvelopeKind::STATUS_MESSAGE, codec::EnvelopeKind::DISCOVERY_REPLY}) {
        auto r = codec::decode_envelope(text, kind);
        REQUIRE(r.ok());
        REQUIRE(r.envelope["Id"] == "f25273b12b094c5a");
        REQUIRE(r.envelope["Data"]["MainboardID"] == "000000000001d354");
        REQUIRE(r.envelope["Data"]["Cmd"] == 0);
    }
}

TEST_CASE("decode_envelope: rejects malformed payloads", "[codec]") {
    SECTION("not JSON") {
        auto r = codec::decode_envelope("M99999", codec::EnvelopeKind::STATUS_MESSAGE);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }

    SECTION("truncated JSON") {
        auto r = codec::decode_envelope(R"({"Status": {)", codec::EnvelopeKind::STATUS_MESSAGE);
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }

    SECTION("JSON array") {
        auto r = codec::decode_envelope("[1,2,3]", codec::EnvelopeKind::STATUS_MESSAGE);
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }

    SECTION("discovery reply without Data") {
        auto r = codec::decode_envelope(R"({"Id":"abc"})", codec::EnvelopeKind::DISCOVERY_REPLY);
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }

    SECTION("number that overflows a double") {
        auto r = codec::decode_envelope(R"({"Status":{"TempOfHotbed":1e400}})",
                                        codec::EnvelopeKind::STATUS_MESSAGE);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);

        auto reply = codec::parse_discovery_reply(R"({"Id":"bad","Data":{"X":1e400}})",
                                                  "192.168.1.9");
        REQUIRE(reply.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }

    SECTION("discovery reply with numeric Id") {
        auto r = codec::decode_envelope(R"({"Id":5,"Data":{}})",
                                        codec::EnvelopeKind::DISCOVERY_REPLY);
        REQUIRE(r.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    }
}

TEST_CASE("decode_envelope: status messages only need an object", "[codec]") {
    auto r = codec::decode_envelope(R"({"Topic":"sdcp/response/x"})",
                                    codec::EnvelopeKind::STATUS_MESSAGE);
    REQUIRE(r.ok());
    REQUIRE(r.envelope.is_object());
}

// ============================================================================
// extract_status()
// ============================================================================

TEST_CASE("extract_status: typical status push", "[codec]") {
    auto r = status_of(STATUS_MESSAGE);

    REQUIRE(r.ok());
    REQUIRE(r.has_status);
    REQUIRE(r.snapshot.current_status == 1);
    REQUIRE(r.snapshot.print_phase == 13);
    REQUIRE(r.snapshot.hotbed_temperature == Approx(60.12));
    REQUIRE(r.snapshot.current_ticks == Approx(3000));
    REQUIRE(r.snapshot.total_ticks == Approx(6000));
}

TEST_CASE("extract_status: string-typed numbers are coerced", "[codec]") {
    auto r = status_of(R"({"Status":{"CurrentStatus":["1"],"TempOfHotbed":"25.3",
        "PrintInfo":{"Status":"6","CurrentTicks":"10","TotalTicks":"100"}}})");

    REQUIRE(r.ok());
    REQUIRE(r.snapshot.current_status == 1);
    REQUIRE(r.snapshot.print_phase == 6);
    REQUIRE(r.snapshot.hotbed_temperature == Approx(25.3));
    REQUIRE(r.snapshot.current_ticks == Approx(10));
    REQUIRE(r.snapshot.total_ticks == Approx(100));
}

TEST_CASE("extract_status: bare CurrentStatus number", "[codec]") {
    auto r = status_of(R"({"Status":{"CurrentStatus":0,"TempOfHotbed":22,
        "PrintInfo":{"Status":0}}})");
    REQUIRE(r.ok());
    REQUIRE(r.snapshot.current_status == 0);
    REQUIRE(r.snapshot.total_ticks == 0.0);
}

TEST_CASE("extract_status: messages without Status are not errors", "[codec]") {
    auto r = status_of(R"({"Id":"x","Data":{"Cmd":0,"Data":{"Ack":0}},"Topic":"sdcp/response/x"})");
    REQUIRE(r.ok());
    REQUIRE_FALSE(r.has_status);
}

TEST_CASE("extract_status: malformed status objects", "[codec]") {
    auto expect_malformed = [](const std::string& text) {
        auto r = status_of(text);
        CHECK(r.has_status);
        CHECK(r.error.type == SdcpErrorType::MALFORMED_STATUS);
    };

    SECTION("Status is not an object") {
        expect_malformed(R"({"Status":"busy"})");
    }

    SECTION("missing CurrentStatus") {
        expect_malformed(R"({"Status":{"TempOfHotbed":22,"PrintInfo":{"Status":0}}})");
    }

    SECTION("empty CurrentStatus array") {
        expect_malformed(
            R"({"Status":{"CurrentStatus":[],"TempOfHotbed":22,"PrintInfo":{"Status":0}}})");
    }

    SECTION("missing PrintInfo") {
        expect_malformed(R"({"Status":{"CurrentStatus":[0],"TempOfHotbed":22}})");
    }

    SECTION("non-numeric PrintInfo.Status") {
        expect_malformed(
            R"({"Status":{"CurrentStatus":[0],"TempOfHotbed":22,"PrintInfo":{"Status":"busy"}}})");
    }

    SECTION("missing TempOfHotbed") {
        expect_malformed(R"({"Status":{"CurrentStatus":[0],"PrintInfo":{"Status":0}}})");
    }

    SECTION("partially numeric temperature") {
        expect_malformed(
            R"({"Status":{"CurrentStatus":[0],"TempOfHotbed":"22C","PrintInfo":{"Status":0}}})");
    }

    SECTION("status code outside int range") {
        expect_malformed(
            R"({"Status":{"CurrentStatus":[1e20],"TempOfHotbed":22,"PrintInfo":{"Status":0}}})");
    }
}

TEST_CASE("extract_status: negative ticks are clamped", "[codec]") {
    auto r = status_of(R"({"Status":{"CurrentStatus":[1],"TempOfHotbed":22,
        "PrintInfo":{"Status":13,"CurrentTicks":-5,"TotalTicks":-1}}})");
    REQUIRE(r.ok());
    REQUIRE(r.snapshot.current_ticks == 0.0);
    REQUIRE(r.snapshot.total_ticks == 0.0);
}

// ============================================================================
// parse_discovery_reply()
// ============================================================================

TEST_CASE("parse_discovery_reply: full reply", "[codec][discovery]") {
    auto reply = codec::parse_discovery_reply(DISCOVERY_REPLY, "192.168.1.50");

    REQUIRE(reply.ok());
    const DeviceDescriptor& d = reply.descriptor;
    REQUIRE(d.id == "f25273b12b094c5a8b9513a30ca60049");
    REQUIRE(d.name == "Centauri Carbon");
    REQUIRE(d.host == "192.168.1.50");
    REQUIRE(d.mainboard_id == "000000000001d354");
    REQUIRE(d.firmware_version == "V1.1.29");
    REQUIRE(d.source_address == "192.168.1.50");
    REQUIRE(d.port == 3030);
    REQUIRE(d.websocket_url() == "ws://192.168.1.50:3030/websocket");
}

TEST_CASE("parse_discovery_reply: missing optional fields", "[codec][discovery]") {
    auto reply = codec::parse_discovery_reply(R"({"Id":"abc","Data":{}})", "10.0.0.7");

    REQUIRE(reply.ok());
    REQUIRE(reply.descriptor.name == "?");
    REQUIRE(reply.descriptor.host == "10.0.0.7");
    REQUIRE(reply.descriptor.mainboard_id == "abc");
    REQUIRE(reply.descriptor.firmware_version.empty());
}

TEST_CASE("parse_discovery_reply: garbage is reported with its source", "[codec][discovery]") {
    auto reply = codec::parse_discovery_reply("hello", "10.0.0.9");

    REQUIRE_FALSE(reply.ok());
    REQUIRE(reply.error.type == SdcpErrorType::MALFORMED_PAYLOAD);
    REQUIRE(reply.error.source == "10.0.0.9");
}

TEST_CASE("parse_discovery_reply: no address at all", "[codec][discovery]") {
    auto reply = codec::parse_discovery_reply(R"({"Id":"abc","Data":{"MainboardIP":""}})", "");
    REQUIRE_FALSE(reply.ok());
}
