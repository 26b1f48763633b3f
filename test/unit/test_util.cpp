// test/unit/test_util.cpp
// -----------------------------------------------------------
// Utility layer: UTF-8 indexing, JSON codec, digests, cipher,
// configuration parsing and log levels.

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/service_config.hpp"
#include "util/cipher.hpp"
#include "util/config_parser.hpp"
#include "util/hashing.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace {

using piiguard::util::json::Value;
namespace utf8 = piiguard::util::utf8;

// ---------------------------------------------------------------- utf8

TEST(Utf8Test, LengthAndBoundaries) {
    const std::string text = "aé€😀";  // 1 + 2 + 3 + 4 bytes
    EXPECT_EQ(utf8::length(text), 4u);
    std::vector<size_t> b = utf8::boundaries(text);
    ASSERT_EQ(b.size(), 5u);
    EXPECT_EQ(b[1], 1u);
    EXPECT_EQ(b[2], 3u);
    EXPECT_EQ(b[3], 6u);
    EXPECT_EQ(b[4], 10u);
    EXPECT_EQ(utf8::codePointIndex(b, 6), 3u);
    EXPECT_EQ(utf8::codePointIndex(b, 7), 3u);
    EXPECT_EQ(utf8::codePointIndex(b, 10), 4u);
}

TEST(Utf8Test, SubstrPrefixAndCodePoints) {
    const std::string text = "Grüße, Zoë";
    EXPECT_EQ(utf8::substr(text, 2, 5), "üße");
    EXPECT_EQ(utf8::prefix(text, 3), "Grü");
    EXPECT_EQ(utf8::prefix(text, 100), text);
    EXPECT_EQ(utf8::codePoints("Zoë").size(), 3u);
    EXPECT_THROW(utf8::substr(text, 3, 50), std::out_of_range);
}

TEST(Utf8Test, InvalidBytesCountAsSingleCodePoints) {
    const std::string broken = std::string("a") + '\xC3' + "b";  // truncated sequence
    EXPECT_EQ(utf8::length(broken), 3u);
}

// ---------------------------------------------------------------- json

TEST(JsonTest, ParseNestedDocument) {
    Value doc = Value::parse(R"({"text":"hi \"you\"\n","n":-12.5,"ok":true,"none":null,
                                 "list":[1,2,{"k":"v"}],"esc":"\u00e9\ud83d\ude00"})");
    ASSERT_TRUE(doc.isObject());
    EXPECT_EQ(doc["text"].asString(), "hi \"you\"\n");
    EXPECT_DOUBLE_EQ(doc["n"].asNumber(), -12.5);
    EXPECT_TRUE(doc["ok"].asBool());
    EXPECT_TRUE(doc["none"].isNull());
    EXPECT_EQ(doc["list"].size(), 3u);
    EXPECT_EQ(doc["list"][2]["k"].asString(), "v");
    EXPECT_EQ(doc["esc"].asString(), "é😀");
    EXPECT_EQ(doc.find("missing"), nullptr);
    EXPECT_THROW(doc["missing"], std::runtime_error);
}

TEST(JsonTest, DumpKeepsInsertionOrderAndEscapes) {
    Value obj = Value::object();
    obj.set("b", 1);
    obj.set("a", "x\"y");
    obj.set("list", Value::fromStrings({"p", "q"}));
    obj.set("b", 2.5);
    EXPECT_EQ(obj.dump(), R"({"b":2.5,"a":"x\"y","list":["p","q"]})");
    EXPECT_EQ(Value(std::string("\x01")).dump(), "\"\\u0001\"");
}

TEST(JsonTest, RejectsMalformedInput) {
    EXPECT_THROW(Value::parse("{\"a\":}"), piiguard::util::json::ParseError);
    EXPECT_THROW(Value::parse("[1,2"), piiguard::util::json::ParseError);
    EXPECT_THROW(Value::parse("{} extra"), piiguard::util::json::ParseError);
    EXPECT_THROW(Value::parse("\"unterminated"), piiguard::util::json::ParseError);
    std::string deep(100, '[');
    EXPECT_THROW(Value::parse(deep), piiguard::util::json::ParseError);
}

TEST(JsonTest, TypeMismatchThrows) {
    Value v = Value::parse("{\"n\":1.5}");
    EXPECT_THROW(v["n"].asString(), std::runtime_error);
    EXPECT_THROW(v["n"].asInt(), std::runtime_error);
}

// ---------------------------------------------------------------- digests / cipher

TEST(JsonTest, LargeObjectParsesInLinearTime) {
    const size_t count = 160000;
    std::string text = "{";
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            text += ',';
        }
        text += "\"k" + std::to_string(i) + "\":" + std::to_string(i);
    }
    text += "}";

    const auto started = std::chrono::steady_clock::now();
    Value doc = Value::parse(text);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(doc.size(), count);
    EXPECT_EQ(doc["k159999"].asInt(), 159999);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 3000);
}

TEST(JsonTest, DuplicateKeysKeepLastValue) {
    Value doc = Value::parse(R"({"a":1,"b":2,"a":3})");
    ASSERT_EQ(doc.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(doc["a"].asInt(), 3);
    EXPECT_EQ(doc.dump(), R"({"a":3,"b":2})");
}

TEST(HashingTest, KnownVectors) {
    EXPECT_EQ(piiguard::util::hashing::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(piiguard::util::hashing::sha512("").substr(0, 16), "cf83e1357eefb8bd");
    EXPECT_THROW(piiguard::util::hashing::digestHex("abc", "crc32"), std::invalid_argument);
}

TEST(CipherTest, RoundTripWithEveryKeySize) {
    namespace cipher = piiguard::util::cipher;
    for (size_t keyLen : {16u, 24u, 32u}) {
        const std::string key(keyLen, 'K');
        const std::string token = cipher::encrypt("Zoë Müller", key);
        EXPECT_EQ(cipher::decrypt(token, key), "Zoë Müller");
    }
    // Fresh IV per call.
    const std::string key(16, 'K');
    EXPECT_NE(cipher::encrypt("same", key), cipher::encrypt("same", key));
}

TEST(CipherTest, RejectsBadKeysAndTokens) {
    namespace cipher = piiguard::util::cipher;
    EXPECT_THROW(cipher::encrypt("x", "tooshort"), std::invalid_argument);
    EXPECT_THROW(cipher::decrypt("abc", std::string(16, 'K')), std::invalid_argument);
    EXPECT_THROW(cipher::decrypt("QUJD", std::string(16, 'K')), std::invalid_argument);
}

TEST(CipherTest, Base64) {
    namespace cipher = piiguard::util::cipher;
    const std::string text = "hello";
    std::vector<unsigned char> bytes(text.begin(), text.end());
    EXPECT_EQ(cipher::base64Encode(bytes), "aGVsbG8=");
    EXPECT_EQ(cipher::base64Decode("aGVsbG8="), bytes);
}

// ---------------------------------------------------------------- config

TEST(ConfigParserTest, DefaultsMatchServiceSettings) {
    piiguard::config::ServiceConfig cfg;
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.defaultLanguage, "en");
    EXPECT_DOUBLE_EQ(cfg.confidenceThreshold, 0.5);
    EXPECT_EQ(cfg.maxContentLength, 16u * 1024u * 1024u);
    EXPECT_EQ(cfg.defaultEntities.size(), 17u);
}

TEST(ConfigParserTest, LoadsKeyValueText) {
    piiguard::config::ServiceConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    parser.loadFromString("# service\n"
                          "port = 8088\n"
                          "\n"
                          "confidenceThreshold=0.7\n"
                          "defaultEntities = PERSON, EMAIL_ADDRESS ,\n"
                          "logLevel=debug\n"
                          "batchConcurrency=2\n"
                          "recognizerEndpoint=http://localhost:5002/\n"
                          "encryptionKey=0123456789abcdef\n"
                          "somethingElse=ignored\n");
    EXPECT_EQ(cfg.port, 8088);
    EXPECT_DOUBLE_EQ(cfg.confidenceThreshold, 0.7);
    ASSERT_EQ(cfg.defaultEntities.size(), 2u);
    EXPECT_EQ(cfg.defaultEntities[1], "EMAIL_ADDRESS");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.batchConcurrency, 2u);
    EXPECT_EQ(cfg.recognizerEndpoint, "http://localhost:5002/");
    EXPECT_EQ(cfg.encryptionKey, "0123456789abcdef");
}

TEST(ConfigParserTest, RejectsMalformedValues) {
    piiguard::config::ServiceConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("port\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("=5\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("port=70000\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("port=-1\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("confidenceThreshold=1.5\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("confidenceThreshold=high\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("batchConcurrency=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("defaultEntities= , \n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("logLevel=loud\n"), std::runtime_error);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    piiguard::config::ServiceConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("/nonexistent/piiguard.conf"));
    EXPECT_EQ(cfg.port, 5000);
}

TEST(ConfigParserTest, LoadsFileAndEnvironmentOverrides) {
    const std::string path = "piiguard_test.conf";
    {
        std::ofstream out(path);
        out << "port=6000\nconfidenceThreshold=0.4\n";
    }
    piiguard::config::ServiceConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(path));
    std::remove(path.c_str());
    EXPECT_EQ(cfg.port, 6000);

    setenv("PIIGUARD_CONFIDENCE_THRESHOLD", "0.9", 1);
    parser.applyEnvironment();
    unsetenv("PIIGUARD_CONFIDENCE_THRESHOLD");
    EXPECT_DOUBLE_EQ(cfg.confidenceThreshold, 0.9);
    EXPECT_EQ(cfg.port, 6000);
}

// ---------------------------------------------------------------- logger

TEST(LoggerTest, ParseLogLevel) {
    using piiguard::util::logger::LogLevel;
    using piiguard::util::logger::parseLogLevel;
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::CRITICAL);
    EXPECT_THROW(parseLogLevel("verbose"), std::runtime_error);
}

} // namespace
