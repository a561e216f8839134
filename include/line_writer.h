#ifndef TEFP_LINE_WRITER_H
#define TEFP_LINE_WRITER_H

#include "result_model.h"

#include <cstdint>
#include <fstream>
#include <string>

struct BGZF;

namespace tefp {

enum class Compression : uint8_t {
    kNone = 0,
    kBgzf = 1
};

// ".gz" and ".bgz" destinations are BGZF compressed, anything else is plain.
Compression compression_for(const std::string& destination);

/**
 * LineWriter: newline-terminated lines to stdout ("-"), a plain file or a
 * BGZF file, chosen by destination name.
 */
class LineWriter {
public:
    explicit LineWriter(const std::string& destination);
    ~LineWriter();

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    void write_line(const std::string& line);

    // Writes every line of the sequence; returns the number written.
    int64_t write_all(const LineSequence& lines);

    // Flush and release the destination; throws std::runtime_error on failure.
    void close();

    const std::string& destination() const { return destination_; }
    Compression compression() const { return compression_; }

private:
    std::string destination_;
    Compression compression_ = Compression::kNone;
    std::ofstream file_;
    BGZF* bgzf_ = nullptr;
    bool to_stdout_ = false;
    bool closed_ = false;
};

}  // namespace tefp

#endif  // TEFP_LINE_WRITER_H
