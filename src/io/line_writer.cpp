#include "line_writer.h"

#include <iostream>
#include <stdexcept>

#include <htslib/bgzf.h>

namespace tefp {
namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

Compression compression_for(const std::string& destination) {
    if (ends_with(destination, ".gz") || ends_with(destination, ".bgz")) {
        return Compression::kBgzf;
    }
    return Compression::kNone;
}

LineWriter::LineWriter(const std::string& destination)
    : destination_(destination), compression_(compression_for(destination)) {
    if (destination_ == "-") {
        to_stdout_ = true;
        compression_ = Compression::kNone;
        return;
    }

    if (compression_ == Compression::kBgzf) {
        bgzf_ = bgzf_open(destination_.c_str(), "w");
        if (bgzf_ == nullptr) {
            throw std::runtime_error("Cannot open for writing: " + destination_);
        }
        return;
    }

    file_.open(destination_);
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open for writing: " + destination_);
    }
}

LineWriter::~LineWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[LineWriter] " << e.what() << '\n';
    }
}

void LineWriter::write_line(const std::string& line) {
    if (closed_) {
        throw std::runtime_error("write to closed destination: " + destination_);
    }

    if (bgzf_ != nullptr) {
        if (bgzf_write(bgzf_, line.data(), line.size()) < 0 || bgzf_write(bgzf_, "\n", 1) < 0) {
            throw std::runtime_error("BGZF write failed: " + destination_);
        }
        return;
    }

    std::ostream& out = to_stdout_ ? std::cout : file_;
    out << line << '\n';
    if (!out) {
        throw std::runtime_error("write failed: " + destination_);
    }
}

int64_t LineWriter::write_all(const LineSequence& lines) {
    int64_t written = 0;
    for (const auto& line : lines) {
        write_line(line);
        ++written;
    }
    return written;
}

void LineWriter::close() {
    if (closed_) return;
    closed_ = true;

    if (bgzf_ != nullptr) {
        const int rc = bgzf_close(bgzf_);
        bgzf_ = nullptr;
        if (rc < 0) {
            throw std::runtime_error("BGZF close failed: " + destination_);
        }
        return;
    }

    if (to_stdout_) {
        std::cout.flush();
        return;
    }

    file_.close();
    if (file_.fail()) {
        throw std::runtime_error("close failed: " + destination_);
    }
}

}  // namespace tefp
