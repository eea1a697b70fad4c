#include "utils.hpp"

#include "sandbox/stream_adapter.hpp"

#include <sstream>
#include <vector>

namespace replbox::test {

using sandbox::ChunkSource;
using sandbox::LinePump;
using sandbox::LineSource;
using sandbox::MakeLineReader;
using sandbox::MakeLineWriter;
using sandbox::StreamError;
using sandbox::WriteSink;

TEST_CASE("001: buffered reader yields lines then end of stream", "[001][stream]") {
    std::istringstream input("first\nsecond\nlast");
    auto reader = MakeLineReader(&input);

    CHECK(reader->ReadLine() == "first\n");
    CHECK(reader->ReadLine() == "second\n");
    CHECK(reader->ReadLine() == "last");
    CHECK(reader->ReadLine().empty());
    CHECK(reader->ReadLine().empty());
}

TEST_CASE("001: missing stream reads empty immediately", "[001][stream]") {
    auto reader = MakeLineReader(std::monostate{});
    CHECK(reader->ReadLine().empty());
    CHECK(reader->ReadAll().empty());

    std::istream* null_stream = nullptr;
    CHECK(MakeLineReader(null_stream)->ReadLine().empty());
    CHECK(MakeLineReader(LineSource{})->ReadLine().empty());
}

TEST_CASE("001: chunk iterator is reassembled into lines", "[001][stream]") {
    std::vector<std::string> chunks = {"he", "llo\nwor", "ld\n", "\n", "tail"};
    std::size_t index = 0;
    ChunkSource source{[&]() -> std::optional<std::string> {
        if (index >= chunks.size()) {
            return std::nullopt;
        }
        return chunks[index++];
    }};
    auto reader = MakeLineReader(source);

    CHECK(reader->ReadLine() == "hello\n");
    CHECK(reader->ReadLine() == "world\n");
    CHECK(reader->ReadLine() == "\n");
    CHECK(reader->ReadLine() == "tail");
    CHECK(reader->ReadLine().empty());
}

TEST_CASE("001: line primitive failures surface as stream errors", "[001][stream]") {
    int calls = 0;
    LineSource source{[&]() -> std::string {
        if (++calls == 1) {
            return "ok\n";
        }
        throw std::runtime_error("connection reset");
    }};
    auto reader = MakeLineReader(source);

    CHECK(reader->ReadLine() == "ok\n");
    CHECK_THROWS_AS(reader->ReadLine(), StreamError);
}

TEST_CASE("001: undecodable bytes are dropped", "[001][stream]") {
    CHECK(sandbox::DecodeUtf8Lossy("abc") == "abc");
    CHECK(sandbox::DecodeUtf8Lossy("a\xff" "b") == "ab");
    CHECK(sandbox::DecodeUtf8Lossy("caf\xc3\xa9") == "caf\xc3\xa9");
    CHECK(sandbox::DecodeUtf8Lossy("trunc\xe2\x82") == "trunc");
    CHECK(sandbox::DecodeUtf8Lossy("\xc0\xaf" "x") == "x");

    std::istringstream input("bad\xfe line\n");
    CHECK(MakeLineReader(&input)->ReadLine() == "bad line\n");
}

TEST_CASE("001: writers flush to streams and sinks", "[001][stream]") {
    std::ostringstream output;
    MakeLineWriter(&output)->WriteAndFlush("{\"code\":\"1\"}\n");
    CHECK(output.str() == "{\"code\":\"1\"}\n");

    std::string captured;
    auto writer = MakeLineWriter(WriteSink{[&](std::string_view data) { captured.append(data); }});
    writer->WriteAndFlush("a\n");
    writer->WriteAndFlush("b\n");
    CHECK(captured == "a\nb\n");

    auto broken = MakeLineWriter(WriteSink{[](std::string_view) { throw std::runtime_error("EPIPE"); }});
    CHECK_THROWS_AS(broken->WriteAndFlush("x\n"), StreamError);

    CHECK_THROWS_AS(MakeLineWriter(std::monostate{})->WriteAndFlush("x\n"), StreamError);
}

TEST_CASE("001: pump delivers lines and a sticky close", "[001][stream]") {
    auto input = std::make_shared<std::istringstream>("one\ntwo\n");
    LinePump pump(MakeLineReader(input.get()));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    auto first = pump.Next(deadline);
    REQUIRE(first.has_value());
    CHECK(first->kind == LinePump::Event::Kind::kLine);
    CHECK(first->text == "one\n");

    auto second = pump.Next(deadline);
    REQUIRE(second.has_value());
    CHECK(second->text == "two\n");

    for (int i = 0; i < 2; ++i) {
        auto closed = pump.Next(deadline);
        REQUIRE(closed.has_value());
        CHECK(closed->kind == LinePump::Event::Kind::kClosed);
    }
    CHECK(pump.Finished());
}

TEST_CASE("001: pump times out while the source is silent", "[001][stream]") {
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    LineSource source{[&]() -> std::string {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return release; });
        return {};
    }};
    {
        LinePump pump(MakeLineReader(source));
        const auto started = std::chrono::steady_clock::now();
        CHECK_FALSE(pump.Next(started + 100ms).has_value());
        CHECK(std::chrono::steady_clock::now() - started >= 100ms);
        CHECK_FALSE(pump.Finished());
        {
            std::lock_guard<std::mutex> lock(mutex);
            release = true;
        }
        cv.notify_all();
        auto closed = pump.Next(std::chrono::steady_clock::now() + 5s);
        REQUIRE(closed.has_value());
        CHECK(closed->kind == LinePump::Event::Kind::kClosed);
    }
}

TEST_CASE("001: pump with a handler forwards every line", "[001][stream]") {
    std::istringstream input("x\ny\n");
    std::vector<std::string> seen;
    std::mutex mutex;
    {
        LinePump pump(MakeLineReader(&input), [&](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(line);
        });
        auto closed = pump.Next(std::chrono::steady_clock::now() + 5s);
        REQUIRE(closed.has_value());
        CHECK(closed->kind == LinePump::Event::Kind::kClosed);
    }
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "x\n");
    CHECK(seen[1] == "y\n");
}

}  // namespace replbox::test
