#include <catch2/catch_test_macros.hpp>
#include <sp/json.h>
#include <sp/sysctl.h>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using namespace sp;

using PairSet = std::set<std::pair<std::string, std::string>>;

static PairSet pairs_of(const Document& doc) {
    PairSet out;
    for (auto const& e : doc) out.emplace(e.key, e.value);
    return out;
}

static PairSet read_back(const std::string& json) {
    auto pairs = parse_json_pairs(json);
    return PairSet(pairs.begin(), pairs.end());
}

TEST_CASE("Flat layout keeps file order", "[json]") {
    auto doc = parse_sysctl("net.ipv4.ip_forward = 1\nkernel.hostname = box\n");
    std::string expected = "{\n"
                           "    \"net.ipv4.ip_forward\": \"1\",\n"
                           "    \"kernel.hostname\": \"box\"\n"
                           "}";
    REQUIRE(dump_json(doc) == expected);
}

TEST_CASE("Entries layout carries line numbers", "[json]") {
    auto doc = parse_sysctl("# c\nnet.ipv4.ip_forward = 1\n");
    std::string expected = "[\n"
                           "    {\"key\": \"net.ipv4.ip_forward\", \"value\": \"1\", \"line\": 2}\n"
                           "]";
    REQUIRE(dump_json(doc, JsonLayout::Entries) == expected);
}

TEST_CASE("Nested layout builds objects from dotted keys", "[json]") {
    auto doc = parse_sysctl("endpoint = localhost:3000\nlog.file = /var/log/console.log\nlog.level = info\n");
    std::string expected = "{\n"
                           "  \"endpoint\": \"localhost:3000\",\n"
                           "  \"log\": {\n"
                           "    \"file\": \"/var/log/console.log\",\n"
                           "    \"level\": \"info\"\n"
                           "  }\n"
                           "}";
    REQUIRE(dump_json(doc, JsonLayout::Nested, 2) == expected);
}

TEST_CASE("Nested layout lets a later key replace a leaf prefix", "[json]") {
    auto doc = parse_sysctl("a = 1\na.b = 2\n");
    REQUIRE(read_back(dump_json(doc, JsonLayout::Nested)) == PairSet{{"a.b", "2"}});
}

TEST_CASE("Empty document renders as empty containers", "[json]") {
    Document doc;
    REQUIRE(dump_json(doc) == "{}");
    REQUIRE(dump_json(doc, JsonLayout::Nested) == "{}");
    REQUIRE(dump_json(doc, JsonLayout::Entries) == "[]");
}

TEST_CASE("Strings are escaped", "[json]") {
    REQUIRE(escape_json_string("a\"b\\c") == "\"a\\\"b\\\\c\"");
    REQUIRE(escape_json_string("tab\there") == "\"tab\\there\"");
    REQUIRE(escape_json_string(std::string("\x01", 1)) == "\"\\u0001\"");
}

TEST_CASE("JSON output reads back to the same pairs", "[json][roundtrip]") {
    std::string text = R"(
kernel.hostname = web "01"
kernel.core_pattern = |/usr/lib/systemd/systemd-coredump %P %u
net.ipv4.ip_local_port_range = 32768	60999
net.ipv4.conf.all.rp_filter = 1
odd\=key = back\slash
empty =
)";
    auto doc = parse_sysctl(text);
    PairSet original = pairs_of(doc);
    REQUIRE(original.size() == 6);

    REQUIRE(read_back(dump_json(doc, JsonLayout::Flat)) == original);
    REQUIRE(read_back(dump_json(doc, JsonLayout::Entries)) == original);
    REQUIRE(read_back(dump_json(doc, JsonLayout::Nested)) == original);
}

TEST_CASE("Reader accepts unicode escapes", "[json]") {
    auto pairs = parse_json_pairs(R"({"k": "caf\u00e9 \ud83d\ude00"})");
    REQUIRE(pairs.size() == 1);
    REQUIRE(pairs[0].second == "caf\xc3\xa9 \xf0\x9f\x98\x80");
}

TEST_CASE("Reader reports malformed JSON with a location", "[json][errors]") {
    try {
        parse_json_pairs("{\n  \"a\": \"1\",\n  \"b\" \"2\"\n}");
        FAIL("expected parse to throw");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("JSON parse error") != std::string::npos);
        REQUIRE(msg.find("line 3") != std::string::npos);
        REQUIRE(msg.find("opened at line 1") != std::string::npos);
    }
}

TEST_CASE("Reader rejects non-string values and trailing data", "[json][errors]") {
    REQUIRE_THROWS_AS(parse_json_pairs(R"({"a": 1})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_json_pairs(R"({"a": "1"} x)"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_json_pairs(R"("just a string")"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_json_pairs(R"([{"key": "a"}])"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_json_pairs(R"({"a": "unterminated)"), std::runtime_error);
}

TEST_CASE("Reader rejects a high surrogate followed by a non-surrogate escape", "[json][errors]") {
    try {
        parse_json_pairs(R"({"k": "\ud800\u0041"})");
        FAIL("expected parse to throw");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("invalid surrogate pair") != std::string::npos);
    }
}
