#include "sandbox/stream_adapter.hpp"

#include <iterator>
#include <type_traits>

namespace replbox::sandbox {
namespace {

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

class NullLineReader : public LineReader {
public:
    std::string ReadLine() override { return {}; }
    std::string ReadAll() override { return {}; }
};

class IstreamLineReader : public LineReader {
public:
    explicit IstreamLineReader(std::istream* stream) : stream_(stream) {}

    std::string ReadLine() override {
        std::string line;
        if (!std::getline(*stream_, line)) {
            if (stream_->bad()) {
                throw StreamError("stream read failed");
            }
            return {};
        }
        if (!stream_->eof()) {
            line.push_back('\n');
        }
        return DecodeUtf8Lossy(line);
    }

    std::string ReadAll() override {
        std::string data{std::istreambuf_iterator<char>(*stream_), std::istreambuf_iterator<char>()};
        if (stream_->bad()) {
            throw StreamError("stream read failed");
        }
        return DecodeUtf8Lossy(data);
    }

private:
    std::istream* stream_;
};

class FunctionLineReader : public LineReader {
public:
    explicit FunctionLineReader(LineSource source) : source_(std::move(source)) {}

    std::string ReadLine() override {
        try {
            return DecodeUtf8Lossy(source_.read_line());
        } catch (const StreamError&) {
            throw;
        } catch (const std::exception& ex) {
            throw StreamError(ex.what());
        }
    }

private:
    LineSource source_;
};

class ChunkLineReader : public LineReader {
public:
    explicit ChunkLineReader(ChunkSource source) : source_(std::move(source)) {}

    std::string ReadLine() override {
        while (true) {
            const auto newline = buffer_.find('\n');
            if (newline != std::string::npos) {
                auto line = buffer_.substr(0, newline + 1);
                buffer_.erase(0, newline + 1);
                return DecodeUtf8Lossy(line);
            }
            if (exhausted_) {
                auto rest = std::move(buffer_);
                buffer_.clear();
                return DecodeUtf8Lossy(rest);
            }
            std::optional<std::string> chunk;
            try {
                chunk = source_.next_chunk();
            } catch (const std::exception& ex) {
                throw StreamError(ex.what());
            }
            if (!chunk.has_value()) {
                exhausted_ = true;
                continue;
            }
            buffer_ += *chunk;
        }
    }

private:
    ChunkSource source_;
    std::string buffer_;
    bool exhausted_ = false;
};

class NullLineWriter : public LineWriter {
public:
    void WriteAndFlush(std::string_view) override {
        throw StreamError("stream is not available");
    }
};

class OstreamLineWriter : public LineWriter {
public:
    explicit OstreamLineWriter(std::ostream* stream) : stream_(stream) {}

    void WriteAndFlush(std::string_view data) override {
        stream_->write(data.data(), static_cast<std::streamsize>(data.size()));
        stream_->flush();
        if (!*stream_) {
            throw StreamError("stream write failed");
        }
    }

private:
    std::ostream* stream_;
};

class SinkLineWriter : public LineWriter {
public:
    explicit SinkLineWriter(WriteSink sink) : sink_(std::move(sink)) {}

    void WriteAndFlush(std::string_view data) override {
        try {
            sink_.write_and_flush(data);
        } catch (const StreamError&) {
            throw;
        } catch (const std::exception& ex) {
            throw StreamError(ex.what());
        }
    }

private:
    WriteSink sink_;
};

}  // namespace

std::string DecodeUtf8Lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }
        std::size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                min_second = 0xA0;
            } else if (lead == 0xED) {
                max_second = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                min_second = 0x90;
            } else if (lead == 0xF4) {
                max_second = 0x8F;
            }
        }
        if (length == 0 || i + length > bytes.size()) {
            ++i;
            continue;
        }
        const auto second = static_cast<unsigned char>(bytes[i + 1]);
        bool valid = second >= min_second && second <= max_second;
        for (std::size_t k = 2; valid && k < length; ++k) {
            valid = IsContinuation(static_cast<unsigned char>(bytes[i + k]));
        }
        if (!valid) {
            ++i;
            continue;
        }
        out.append(bytes.data() + i, length);
        i += length;
    }
    return out;
}

std::string LineReader::ReadAll() {
    std::string data;
    while (true) {
        auto line = ReadLine();
        if (line.empty()) {
            break;
        }
        data += line;
    }
    return data;
}

std::unique_ptr<LineReader> MakeLineReader(ReadHandle handle) {
    return std::visit([](auto&& value) -> std::unique_ptr<LineReader> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::istream*>) {
            if (value == nullptr) {
                return std::make_unique<NullLineReader>();
            }
            return std::make_unique<IstreamLineReader>(value);
        } else if constexpr (std::is_same_v<T, LineSource>) {
            if (!value.read_line) {
                return std::make_unique<NullLineReader>();
            }
            return std::make_unique<FunctionLineReader>(std::move(value));
        } else if constexpr (std::is_same_v<T, ChunkSource>) {
            if (!value.next_chunk) {
                return std::make_unique<NullLineReader>();
            }
            return std::make_unique<ChunkLineReader>(std::move(value));
        } else {
            return std::make_unique<NullLineReader>();
        }
    }, std::move(handle));
}

std::unique_ptr<LineWriter> MakeLineWriter(WriteHandle handle) {
    return std::visit([](auto&& value) -> std::unique_ptr<LineWriter> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::ostream*>) {
            if (value == nullptr) {
                return std::make_unique<NullLineWriter>();
            }
            return std::make_unique<OstreamLineWriter>(value);
        } else if constexpr (std::is_same_v<T, WriteSink>) {
            if (!value.write_and_flush) {
                return std::make_unique<NullLineWriter>();
            }
            return std::make_unique<SinkLineWriter>(std::move(value));
        } else {
            return std::make_unique<NullLineWriter>();
        }
    }, std::move(handle));
}

LinePump::LinePump(std::unique_ptr<LineReader> reader, LineHandler handler)
    : reader_(std::move(reader))
    , handler_(std::move(handler)) {
    worker_ = std::thread([this]() { Run(); });
}

LinePump::~LinePump() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<LinePump::Event> LinePump::Next(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return !lines_.empty() || terminal_.has_value(); });
    if (!lines_.empty()) {
        Event event{Event::Kind::kLine, std::move(lines_.front())};
        lines_.pop_front();
        return event;
    }
    if (terminal_.has_value()) {
        return terminal_;
    }
    return std::nullopt;
}

bool LinePump::Finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_.has_value();
}

void LinePump::Run() {
    while (true) {
        std::string line;
        try {
            line = reader_->ReadLine();
        } catch (const std::exception& ex) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                terminal_ = Event{Event::Kind::kError, ex.what()};
            }
            cv_.notify_all();
            return;
        }
        if (line.empty()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                terminal_ = Event{Event::Kind::kClosed, {}};
            }
            cv_.notify_all();
            return;
        }
        if (handler_) {
            handler_(line);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(std::move(line));
        }
        cv_.notify_all();
    }
}

}  // namespace replbox::sandbox
