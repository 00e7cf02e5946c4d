#pragma once

#include "experiment/ramsey_circuit.hpp"
#include "experiment/records.types.hpp"
#include "progress_reporter.hpp"

#include <cstddef>
#include <utility>

// Black-box capability that executes a prepared Ramsey circuit for a number
// of shots and reports the aggregate outcome counts. Implementations return
// tallies whose counts sum to `shots` and throw std::invalid_argument for a
// non-positive shot count.
class ExecutionService {
  public:
    virtual ~ExecutionService() = default;

    virtual OutcomeTally run(const RamseyCircuit& circuit, int shots) = 0;

    void set_log_sink(LogSink sink) { log_sink_ = std::move(sink); }

    void set_progress_reporter(ramsey_lab::ProgressReporter* reporter) {
        progress_reporter_ = reporter;
    }

  protected:
    void emit_log(const ExecutionLog& log) const {
        if (log_sink_) {
            log_sink_(log);
        }
    }

    void report_progress(std::size_t completed) const {
        if (progress_reporter_) {
            progress_reporter_->increment_completed_steps(completed);
        }
    }

  private:
    LogSink log_sink_;
    ramsey_lab::ProgressReporter* progress_reporter_ = nullptr;
};
