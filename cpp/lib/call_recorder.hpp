/**
 * Call Recorder
 *
 * Record/replay harness for regression tests. In live mode every recorded
 * call runs and its result is saved per call site; in replay mode results
 * come back from a recording in the same order without running the call.
 * The output a session writes is saved with the recording and compared on
 * replay.
 *
 * Recording layout (gzip-compressed metadata-codec JSON):
 *
 *   {"inputs": [{"<call site>": [result, ...], ...}, ...], "results": "<output>"}
 */

#ifndef CALL_RECORDER_HPP
#define CALL_RECORDER_HPP

#include "byte_stream.hpp"
#include "chunked_common.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace chunked {

/**
 * Recorder mode interface
 */
class RecorderMode {
public:
    virtual ~RecorderMode() = default;

    virtual const char* name() const = 0;

    virtual bool is_configured() const = 0;

    /**
     * Result for the next call at call_site
     */
    virtual Value get(const std::string& call_site, const std::function<Value()>& call) = 0;

    /**
     * Start the next part of the session
     */
    virtual void next_part() = 0;

    /**
     * End the session given the output it wrote
     */
    virtual void stop(const std::string& output) = 0;
};

/**
 * No mode selected: every operation throws NotConfiguredError
 */
class UninitializedMode : public RecorderMode {
public:
    const char* name() const override { return "uninitialized"; }
    bool is_configured() const override { return false; }

    Value get(const std::string& call_site, const std::function<Value()>& call) override;
    void next_part() override;
    void stop(const std::string& output) override;
};

/**
 * Live mode: run calls and record their results
 */
class LiveMode : public RecorderMode {
public:
    explicit LiveMode(const std::string& path);

    const char* name() const override { return "live"; }
    bool is_configured() const override { return true; }

    Value get(const std::string& call_site, const std::function<Value()>& call) override;
    void next_part() override;

    /**
     * Save the recording
     */
    void stop(const std::string& output) override;

private:
    std::string path_;
    Value parts_;   // Array of {call site: [results]}
};

/**
 * Replay mode: return recorded results in order
 */
class ReplayMode : public RecorderMode {
public:
    /**
     * @throws StreamError if the recording cannot be read
     * @throws RecordingMismatchError if it has no parts
     */
    explicit ReplayMode(const std::string& path);

    const char* name() const override { return "replay"; }
    bool is_configured() const override { return true; }

    /**
     * @throws RecordingMismatchError when no recorded result is left for call_site
     */
    Value get(const std::string& call_site, const std::function<Value()>& call) override;
    void next_part() override;

    /**
     * @throws RecordingMismatchError if output differs from the recorded output
     */
    void stop(const std::string& output) override;

private:
    std::string path_;
    Value parts_;
    std::string expected_output_;
    size_t part_index_;
    std::map<std::string, size_t> cursors_;   // Next result per call site in current part
};

/**
 * Call recorder
 * Starts uninitialized; a mode is selected exactly once.
 */
class CallRecorder {
public:
    CallRecorder();

    /**
     * Record a live session to path
     * @throws ContractError if a mode is already selected
     */
    void select_live(const std::string& path);

    /**
     * Replay the session recorded at path
     * @throws ContractError if a mode is already selected
     */
    void select_replay(const std::string& path);

    Value get(const std::string& call_site, const std::function<Value()>& call);
    void next_part();

    /**
     * Save (live) or verify (replay) the session output
     */
    void stop();

    /**
     * Stream the session writes to
     * @throws NotConfiguredError before a mode is selected
     */
    MemoryByteStream& output();

    std::string mode_name() const;

private:
    std::unique_ptr<RecorderMode> mode_;
    MemoryByteStream output_;

    void require_unselected() const;
};

} // namespace chunked

#endif // CALL_RECORDER_HPP
