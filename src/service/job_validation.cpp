#include "service/job.hpp"
#include "service/job_validation.hpp"

#include "noise.hpp"
#include "readout_mitigation.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace service {
namespace {

constexpr double kMinReadoutContrast = 1e-9;

class ShotsValidator final : public Validator {
public:
    void validate(const EstimationJobRequest& job) const override {
        if (job.shots == 0) {
            throw std::invalid_argument("shots must be supplied");
        }
        if (job.shots < 0) {
            std::ostringstream oss;
            oss << "shots must be positive (got " << job.shots << ")";
            throw std::invalid_argument(oss.str());
        }
    }

    std::string name() const override {
        return "shots";
    }
};

class PhaseValidator final : public Validator {
public:
    void validate(const EstimationJobRequest& job) const override {
        if (!std::isfinite(job.phase_shift)) {
            throw std::invalid_argument("phase_shift must be a finite number of radians");
        }
        if (job.actual_phase && !std::isfinite(*job.actual_phase)) {
            throw std::invalid_argument("actual_phase must be a finite number of radians");
        }
    }

    std::string name() const override {
        return "phase";
    }
};

class NoiseValidator final : public Validator {
public:
    void validate(const EstimationJobRequest& job) const override {
        if (job.noise_config) {
            SimpleNoiseEngine::validate_config(*job.noise_config);
        }
    }

    std::string name() const override {
        return "noise";
    }
};

class MitigationValidator final : public Validator {
public:
    void validate(const EstimationJobRequest& job) const override {
        if (!job.mitigate_readout) {
            return;
        }
        if (!job.noise_config) {
            throw std::invalid_argument(
                "readout mitigation requires a noise configuration with readout rates");
        }
        if (ramsey_lab::readout_contrast(job.noise_config->readout) < kMinReadoutContrast) {
            std::ostringstream oss;
            oss << "readout confusion matrix is singular (p01="
                << job.noise_config->readout.p_flip0_to_1
                << " p10=" << job.noise_config->readout.p_flip1_to_0 << ")";
            throw std::invalid_argument(oss.str());
        }
    }

    std::string name() const override {
        return "mitigation";
    }
};

}  // namespace

std::string Validator::name() const {
    return "validator";
}

LambdaValidator::LambdaValidator(std::string name, ValidateFn fn)
    : name_(std::move(name))
    , fn_(std::move(fn)) {}

void LambdaValidator::validate(const EstimationJobRequest& job) const {
    if (fn_) {
        fn_(job);
    }
}

std::string LambdaValidator::name() const {
    return name_;
}

void ValidatorRegistry::register_validator(std::unique_ptr<Validator> validator) {
    if (validator) {
        validators_.push_back(std::move(validator));
    }
}

void ValidatorRegistry::run_all_validators(const EstimationJobRequest& job) const {
    for (const auto& validator : validators_) {
        validator->validate(job);
    }
}

std::vector<std::string> ValidatorRegistry::validator_names() const {
    std::vector<std::string> names;
    names.reserve(validators_.size());
    for (const auto& validator : validators_) {
        names.push_back(validator->name());
    }
    return names;
}

ValidatorRegistry make_validator_registry_for(const EstimationJobRequest& job) {
    ValidatorRegistry registry;
    registry.register_validator(make_shots_validator());
    registry.register_validator(make_phase_validator());
    if (job.noise_config) {
        registry.register_validator(make_noise_validator());
    }
    if (job.mitigate_readout) {
        registry.register_validator(make_mitigation_validator());
    }
    return registry;
}

std::unique_ptr<Validator> make_shots_validator() {
    return std::make_unique<ShotsValidator>();
}

std::unique_ptr<Validator> make_phase_validator() {
    return std::make_unique<PhaseValidator>();
}

std::unique_ptr<Validator> make_noise_validator() {
    return std::make_unique<NoiseValidator>();
}

std::unique_ptr<Validator> make_mitigation_validator() {
    return std::make_unique<MitigationValidator>();
}

}  // namespace service
