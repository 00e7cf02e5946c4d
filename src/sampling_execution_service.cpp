#include "sampling_execution_service.hpp"

#include "phase_model.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

SamplingExecutionService::SamplingExecutionService(
    std::shared_ptr<const NoiseEngine> noise,
    SamplingOptions options
)
    : noise_(std::move(noise))
    , options_(std::move(options)) {}

std::vector<std::uint64_t> SamplingExecutionService::seeds_for(int shots) const {
    if (!options_.shot_seeds.empty()) {
        if (static_cast<int>(options_.shot_seeds.size()) != shots) {
            throw std::invalid_argument("shot seeds must match the requested shots");
        }
        return options_.shot_seeds;
    }

    std::vector<std::uint64_t> seeds;
    seeds.reserve(static_cast<std::size_t>(shots));
    std::mt19937_64 seed_rng(options_.seed ? *options_.seed : std::random_device{}());
    for (int i = 0; i < shots; ++i) {
        seeds.push_back(seed_rng());
    }
    return seeds;
}

OutcomeTally SamplingExecutionService::run(const RamseyCircuit& circuit, int shots) {
    if (shots <= 0) {
        throw std::invalid_argument(
            "shots must be positive (got " + std::to_string(shots) + ")");
    }

    const std::vector<std::uint64_t> seeds = seeds_for(shots);

    const std::size_t hardware_threads = std::thread::hardware_concurrency();
    const std::size_t default_threads = hardware_threads > 0 ? hardware_threads : 1;
    const std::size_t worker_limit =
        options_.max_threads > 0 ? options_.max_threads : default_threads;
    const std::size_t worker_count = std::min<std::size_t>(
        static_cast<std::size_t>(shots), worker_limit);

    std::vector<int> per_shot_bits(static_cast<std::size_t>(shots), 0);
    std::vector<std::vector<ExecutionLog>> per_shot_logs(static_cast<std::size_t>(shots));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    std::mutex failure_mutex;
    std::exception_ptr failure;

    const std::size_t base_shots = static_cast<std::size_t>(shots) / worker_count;
    const std::size_t remainder = static_cast<std::size_t>(shots) % worker_count;
    std::size_t shot_offset = 0;

    for (std::size_t worker_idx = 0; worker_idx < worker_count; ++worker_idx) {
        const std::size_t shots_for_worker = base_shots + (worker_idx < remainder ? 1 : 0);
        if (shots_for_worker == 0) {
            continue;
        }
        const std::size_t start = shot_offset;
        const std::size_t end = start + shots_for_worker;
        workers.emplace_back([
            this,
            &circuit,
            &seeds,
            &per_shot_bits,
            &per_shot_logs,
            start,
            end,
            &failure_mutex,
            &failure
        ]() {
            try {
                std::size_t current_shot = start;
                std::shared_ptr<NoiseEngine> noise;
                if (noise_) {
                    noise = noise_->clone();
                    if (options_.log_noise_events) {
                        noise->set_log_sink(
                            [&per_shot_logs, &current_shot](
                                const std::string& category,
                                const std::string& message
                            ) {
                                per_shot_logs[current_shot].push_back(ExecutionLog{
                                    static_cast<int>(current_shot), category, message});
                            });
                    }
                }
                for (; current_shot < end; ++current_shot) {
                    std::mt19937_64 rng(seeds[current_shot]);
                    StdRandomStream stream(rng);
                    double phase = circuit.phase_shift;
                    if (noise) {
                        noise->apply_phase_noise(phase, stream);
                    }
                    const double p = ramsey_lab::predicted_probability_of_one(phase);
                    int bit = stream.uniform(0.0, 1.0) < p ? 1 : 0;
                    if (noise) {
                        noise->apply_measurement_noise(bit, stream);
                    }
                    per_shot_bits[current_shot] = bit;
                    report_progress(1);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        });
        shot_offset = end;
    }

    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    OutcomeTally tally;
    for (const int bit : per_shot_bits) {
        if (bit == 1) {
            ++tally.count_one;
        } else {
            ++tally.count_zero;
        }
    }

    for (const auto& shot_logs : per_shot_logs) {
        for (const auto& log : shot_logs) {
            emit_log(log);
        }
    }

    std::ostringstream oss;
    oss << "mode=sampling label=" << circuit.label
        << " phase=" << circuit.phase_shift
        << " shots=" << shots
        << " workers=" << worker_count
        << " count_one=" << tally.count_one;
    emit_log(ExecutionLog{kRunLevelShot, "Execution", oss.str()});
    return tally;
}
