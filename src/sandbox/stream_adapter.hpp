#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

namespace replbox::sandbox {

class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Explicit "read one line" primitive. Returns "" at end of stream.
struct LineSource {
    std::function<std::string()> read_line;
};

// Push-style iterator over chunks of arbitrary size. Returns nullopt when exhausted.
struct ChunkSource {
    std::function<std::optional<std::string>()> next_chunk;
};

struct WriteSink {
    std::function<void(std::string_view)> write_and_flush;
};

// Whatever the platform hands out for a process stream. monostate means the
// stream does not exist.
using ReadHandle = std::variant<std::monostate, std::istream*, LineSource, ChunkSource>;
using WriteHandle = std::variant<std::monostate, std::ostream*, WriteSink>;

// Drops bytes that do not form valid UTF-8 sequences.
std::string DecodeUtf8Lossy(std::string_view bytes);

class LineReader {
public:
    virtual ~LineReader() = default;

    // One line including its trailing '\n', or "" at end of stream.
    virtual std::string ReadLine() = 0;
    virtual std::string ReadAll();
};

class LineWriter {
public:
    virtual ~LineWriter() = default;
    virtual void WriteAndFlush(std::string_view data) = 0;
};

std::unique_ptr<LineReader> MakeLineReader(ReadHandle handle);
std::unique_ptr<LineWriter> MakeLineWriter(WriteHandle handle);

// Reads lines on a background thread so callers can wait with a deadline.
// End of stream and read errors are sticky: once seen they are returned by
// every later Next().
class LinePump {
public:
    struct Event {
        enum class Kind { kLine, kClosed, kError };
        Kind kind = Kind::kLine;
        std::string text;
    };
    using LineHandler = std::function<void(const std::string&)>;

    // With a handler every line goes to it instead of the queue.
    LinePump(std::unique_ptr<LineReader> reader, LineHandler handler = {});
    ~LinePump();

    LinePump(const LinePump&) = delete;
    LinePump& operator=(const LinePump&) = delete;

    // nullopt when the deadline passes with nothing to report.
    std::optional<Event> Next(std::chrono::steady_clock::time_point deadline);
    bool Finished() const;

private:
    void Run();

    std::unique_ptr<LineReader> reader_;
    LineHandler handler_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    std::optional<Event> terminal_;
    std::thread worker_;
};

}  // namespace replbox::sandbox
