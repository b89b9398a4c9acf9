/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace adaptive_pool {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is `<log_dir>/<prefix>.ndjson`. When it would grow past
 * max_file_size_mb it is renamed to `<prefix>.1.ndjson`, older generations
 * shift up by one, and anything beyond max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// Only for tests: rotate at a byte count instead of megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed(size_t incoming);
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout — useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output — useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory so tests can assert on emitted events.
 *
 * Not internally synchronized; Logger and MetricsCollector serialize writes.
 * Readers must hold a copy obtained after the writers have quiesced.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

private:
    std::vector<std::string> lines_;
};

}  // namespace adaptive_pool
