/**
 * Call Recorder - Implementation
 */

#include "call_recorder.hpp"
#include "metadata_codec.hpp"
#include "recorder.hpp"

namespace chunked {

// ============================================================================
// UninitializedMode Implementation
// ============================================================================

namespace {

[[noreturn]] void throw_not_configured(const char* operation) {
    throw NotConfiguredError(std::string("Call recorder is not in live or replay mode: cannot ")
                             + operation);
}

} // namespace

Value UninitializedMode::get(const std::string&, const std::function<Value()>&) {
    throw_not_configured("get");
}

void UninitializedMode::next_part() {
    throw_not_configured("start the next part");
}

void UninitializedMode::stop(const std::string&) {
    throw_not_configured("stop");
}

// ============================================================================
// LiveMode Implementation
// ============================================================================

LiveMode::LiveMode(const std::string& path)
    : path_(path), parts_(Value::array()) {
    parts_.push_back(Value::object());
}

Value LiveMode::get(const std::string& call_site, const std::function<Value()>& call) {
    Value result = call();

    Value& part = parts_.back();
    if (!part.contains(call_site)) {
        part[call_site] = Value::array();
    }
    part[call_site].push_back(result);

    return result;
}

void LiveMode::next_part() {
    parts_.push_back(Value::object());
}

void LiveMode::stop(const std::string& output) {
    Value recording = Value::object();
    recording["inputs"] = parts_;
    recording["results"] = output;

    MetadataEncoder encoder;
    save_recording(path_, encoder.encode(recording));
}

// ============================================================================
// ReplayMode Implementation
// ============================================================================

ReplayMode::ReplayMode(const std::string& path)
    : path_(path), part_index_(0) {

    MetadataDecoder decoder;
    Value recording = decoder.decode(load_recording(path));

    if (!recording.is_object() || !recording.contains("inputs") || !recording.contains("results")
        || !recording["inputs"].is_array() || !recording["results"].is_string()) {
        throw RecordingMismatchError("Not a call recording: " + path);
    }

    parts_ = recording["inputs"];
    expected_output_ = recording["results"].get<std::string>();

    if (parts_.empty()) {
        throw RecordingMismatchError("Call recording has no parts: " + path);
    }
}

Value ReplayMode::get(const std::string& call_site, const std::function<Value()>&) {
    const Value& part = parts_[part_index_];

    if (!part.contains(call_site)) {
        throw RecordingMismatchError("No recorded results for " + call_site
                                     + " in part " + std::to_string(part_index_));
    }

    const Value& results = part[call_site];
    size_t& cursor = cursors_[call_site];

    if (cursor >= results.size()) {
        throw RecordingMismatchError("Recorded results for " + call_site + " exhausted after "
                                     + std::to_string(results.size()) + " calls");
    }

    return results[cursor++];
}

void ReplayMode::next_part() {
    if (part_index_ + 1 >= parts_.size()) {
        throw RecordingMismatchError("No more recorded parts in " + path_);
    }

    part_index_++;
    cursors_.clear();
}

void ReplayMode::stop(const std::string& output) {
    if (output == expected_output_) {
        return;
    }

    size_t position = 0;
    while (position < output.size() && position < expected_output_.size()
           && output[position] == expected_output_[position]) {
        position++;
    }

    throw RecordingMismatchError("Output differs from recording " + path_ + " at byte "
                                 + std::to_string(position) + " (expected "
                                 + std::to_string(expected_output_.size()) + " bytes, got "
                                 + std::to_string(output.size()) + ")");
}

// ============================================================================
// CallRecorder Implementation
// ============================================================================

CallRecorder::CallRecorder()
    : mode_(std::make_unique<UninitializedMode>()) {
}

void CallRecorder::require_unselected() const {
    if (mode_->is_configured()) {
        throw ContractError(std::string("Call recorder is already in ") + mode_->name() + " mode");
    }
}

void CallRecorder::select_live(const std::string& path) {
    require_unselected();
    mode_ = std::make_unique<LiveMode>(path);
}

void CallRecorder::select_replay(const std::string& path) {
    require_unselected();
    mode_ = std::make_unique<ReplayMode>(path);
}

Value CallRecorder::get(const std::string& call_site, const std::function<Value()>& call) {
    return mode_->get(call_site, call);
}

void CallRecorder::next_part() {
    mode_->next_part();
}

void CallRecorder::stop() {
    mode_->stop(output_.getvalue());
}

MemoryByteStream& CallRecorder::output() {
    if (!mode_->is_configured()) {
        throw_not_configured("provide an output stream");
    }
    return output_;
}

std::string CallRecorder::mode_name() const {
    return mode_->name();
}

} // namespace chunked
