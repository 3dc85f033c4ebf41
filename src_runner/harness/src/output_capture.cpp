#include "babel_testing/output_capture.hpp"

#include <iostream>
#include <mutex>
#include <streambuf>
#include <utility>

namespace babel::testing {

namespace {

/// Stream buffer that either records text or forwards it to the buffer it replaced.
class RoutingBuffer : public std::streambuf {
public:
    explicit RoutingBuffer(std::ostream& stream) : stream_{stream} {}

    void begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_.rdbuf() != this) {
            forward_ = stream_.rdbuf(this);
        }
        captured_.clear();
        capturing_ = true;
    }

    std::string end() {
        std::lock_guard<std::mutex> lock(mutex_);
        capturing_ = false;
        std::string text;
        text.swap(captured_);
        return text;
    }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        const char c = traits_type::to_char_type(ch);
        return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
    }

    std::streamsize xsputn(const char* data, std::streamsize size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capturing_) {
            captured_.append(data, static_cast<std::size_t>(size));
            return size;
        }
        return forward_ ? forward_->sputn(data, size) : size;
    }

    int sync() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return (!capturing_ && forward_) ? forward_->pubsync() : 0;
    }

private:
    std::ostream& stream_;
    std::mutex mutex_;
    std::streambuf* forward_{nullptr};
    std::string captured_;
    bool capturing_{false};
};

// Never destroyed: the standard streams may still be flushed during static destruction.
RoutingBuffer& stdout_router() {
    static auto* router = new RoutingBuffer(std::cout);
    return *router;
}

RoutingBuffer& stderr_router() {
    static auto* router = new RoutingBuffer(std::cerr);
    return *router;
}

}  // namespace

OutputCapture::~OutputCapture() {
    if (active_) {
        (void)stop();
    }
}

void OutputCapture::start() {
    if (!enabled_ || active_) {
        return;
    }
    std::cout.flush();
    std::cerr.flush();
    stdout_router().begin();
    stderr_router().begin();
    active_ = true;
}

std::vector<OutputBlock> OutputCapture::stop() {
    std::vector<OutputBlock> blocks;
    if (!active_) {
        return blocks;
    }
    active_ = false;

    if (auto text = stdout_router().end(); !text.empty()) {
        blocks.push_back(OutputBlock{"stdout", std::move(text)});
    }
    if (auto text = stderr_router().end(); !text.empty()) {
        blocks.push_back(OutputBlock{"stderr", std::move(text)});
    }
    return blocks;
}

std::vector<std::string> as_logs(const std::vector<OutputBlock>& blocks) {
    std::vector<std::string> logs;
    logs.reserve(blocks.size());
    for (const auto& block : blocks) {
        logs.push_back("[" + block.stream + "]\n" + block.text);
    }
    return logs;
}

}  // namespace babel::testing
