/**
 * Flush Threshold Mixin (CRTP Pattern)
 *
 * Provides threshold-driven flushing to any buffered chunk writer using the
 * Curiously Recurring Template Pattern (CRTP).
 *
 * Required Interface (enforced at compile time):
 * The derived class must implement:
 *
 *   size_t get_buffer_size() const
 *       Returns the number of records currently buffered
 *
 *   size_t get_buffer_bytes() const
 *       Returns the number of bytes currently buffered
 *
 *   void perform_flush()
 *       Emits one intermediate chunk from the buffered records
 *
 * Usage Example:
 *
 *   class MyWriter : public FlushThresholdMixin<MyWriter> {
 *       friend class FlushThresholdMixin<MyWriter>;
 *   private:
 *       size_t get_buffer_size() const { return rows_.size(); }
 *       size_t get_buffer_bytes() const { return bytes_; }
 *       void perform_flush() { ... }
 *   public:
 *       void write_record(const Record& r) {
 *           rows_.push_back(serialize(r));
 *           check_and_flush();
 *       }
 *   };
 */

#ifndef FLUSH_THRESHOLD_MIXIN_HPP
#define FLUSH_THRESHOLD_MIXIN_HPP

#include <cstddef>
#include <iostream>
#include <string>

namespace chunked {

/**
 * CRTP Mixin for flush threshold management
 *
 * @tparam Derived The derived class type (CRTP pattern)
 */
template<typename Derived>
class FlushThresholdMixin {
protected:
    // ========================================================================
    // Configuration
    // ========================================================================
    size_t max_result_rows_;                       // Row-count flush trigger
    size_t memory_threshold_bytes_;                // Memory-based flush trigger (0 = off)
    bool verbose_;                                 // Log flushes to stderr

    // ========================================================================
    // State
    // ========================================================================
    size_t flush_count_;                           // Chunks emitted so far

    /**
     * Constructor
     * @param max_result_rows Records per chunk before an implicit flush
     */
    explicit FlushThresholdMixin(size_t max_result_rows)
        : max_result_rows_(max_result_rows),
          memory_threshold_bytes_(0),
          verbose_(false),
          flush_count_(0) {
    }

    // Non-copyable
    FlushThresholdMixin(const FlushThresholdMixin&) = delete;
    FlushThresholdMixin& operator=(const FlushThresholdMixin&) = delete;

public:
    // ========================================================================
    // Configuration API
    // ========================================================================

    /**
     * Set row-count threshold (maxresultrows)
     * @param rows Records per chunk (0 to disable)
     */
    void set_max_result_rows(size_t rows) {
        max_result_rows_ = rows;
    }

    /**
     * Set memory threshold (memory-based trigger)
     * @param bytes Memory threshold in bytes (0 to disable)
     */
    void set_memory_threshold(size_t bytes) {
        memory_threshold_bytes_ = bytes;
    }

    /**
     * Log flushes to stderr
     */
    void set_verbose(bool verbose) {
        verbose_ = verbose;
    }

    // ========================================================================
    // Getters
    // ========================================================================

    size_t get_max_result_rows() const {
        return max_result_rows_;
    }

    size_t get_memory_threshold() const {
        return memory_threshold_bytes_;
    }

    size_t get_flush_count() const {
        return flush_count_;
    }

    size_t get_current_memory_usage() const {
        return derived()->get_buffer_bytes();
    }

protected:
    // ========================================================================
    // CRTP Helper
    // ========================================================================

    Derived* derived() {
        return static_cast<Derived*>(this);
    }

    const Derived* derived() const {
        return static_cast<const Derived*>(this);
    }

    // ========================================================================
    // Core Logic
    // ========================================================================

    /**
     * Check if flush should be triggered
     * Uses OR logic: flushes if row count reached OR memory exceeded
     */
    bool should_flush() const {
        size_t buffer_size = derived()->get_buffer_size();
        if (buffer_size == 0) {
            return false;
        }

        bool rows_reached = max_result_rows_ > 0 && buffer_size >= max_result_rows_;

        bool memory_exceeded = memory_threshold_bytes_ > 0
            && derived()->get_buffer_bytes() >= memory_threshold_bytes_;

        return rows_reached || memory_exceeded;
    }

    /**
     * Count a chunk that was written
     * Call after every successful flush, implicit or explicit
     */
    void record_flush(size_t records, const std::string& mode) {
        flush_count_++;

        // Quiet mode after 3 flushes
        if (verbose_ && flush_count_ <= 3) {
            std::cerr << "[FLUSH] Chunk " << flush_count_ << " (" << mode << "): "
                      << records << " records" << std::endl;
        }
    }

public:
    // ========================================================================
    // Primary Interface - Call this from derived class
    // ========================================================================

    /**
     * Check and perform flush if needed
     *
     * Usage: Call after adding each record to buffer
     */
    void check_and_flush() {
        if (should_flush()) {
            derived()->perform_flush();
        }
    }
};

} // namespace chunked

#endif // FLUSH_THRESHOLD_MIXIN_HPP
