// tests/test_logging.cpp
#undef NDEBUG
#include "alm/utils/logging.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace alm;

// Redirects a stream into a buffer for the lifetime of the object
class CaptureStream {
public:
    explicit CaptureStream(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStream() { stream_.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

void test_levels() {
    std::cout << "=== Testing log levels ===" << std::endl;

    assert(logging::get_level() == logging::Level::Info);

    std::string out;
    {
        CaptureStream capture(std::cout);
        logging::debug("hidden");
        logging::info("shown");
        out = capture.str();
    }
    assert(out.find("hidden") == std::string::npos);
    assert(out.find("[INFO] shown") != std::string::npos);

    logging::set_level(logging::Level::Debug);
    {
        CaptureStream capture(std::cout);
        logging::debug("now visible");
        out = capture.str();
    }
    assert(out.find("[DEBUG] now visible") != std::string::npos);

    logging::set_level(logging::Level::Error);
    std::string err;
    {
        CaptureStream capture(std::cerr);
        logging::warning("dropped");
        logging::error("kept");
        err = capture.str();
    }
    assert(err.find("dropped") == std::string::npos);
    assert(err.find("[ERROR] kept") != std::string::npos);

    logging::set_level(logging::Level::Info);
    std::cout << "Log levels passed!" << std::endl;
}

void test_warn_once() {
    std::cout << "=== Testing warn_once ===" << std::endl;

    std::string err;
    {
        CaptureStream capture(std::cerr);
        logging::warn_once("soft clip disabled");
        logging::warn_once("soft clip disabled");
        logging::warn_once("other warning");
        err = capture.str();
    }

    size_t first = err.find("soft clip disabled");
    assert(first != std::string::npos);
    assert(err.find("soft clip disabled", first + 1) == std::string::npos);
    assert(err.find("[WARNING] other warning") != std::string::npos);

    std::cout << "warn_once passed!" << std::endl;
}

int main() {
    test_levels();
    test_warn_once();

    std::cout << "\n=== All logging tests completed successfully! ===" << std::endl;
    return 0;
}
