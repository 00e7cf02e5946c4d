#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace service {

struct EstimationJobRequest;

class Validator {
public:
    virtual ~Validator() = default;
    virtual void validate(const EstimationJobRequest& job) const = 0;
    virtual std::string name() const;
};

class LambdaValidator final : public Validator {
public:
    using ValidateFn = std::function<void(const EstimationJobRequest& job)>;

    LambdaValidator(std::string name, ValidateFn fn);
    void validate(const EstimationJobRequest& job) const override;
    std::string name() const override;

private:
    std::string name_;
    ValidateFn fn_;
};

class ValidatorRegistry final {
public:
    void register_validator(std::unique_ptr<Validator> validator);
    void run_all_validators(const EstimationJobRequest& job) const;
    std::vector<std::string> validator_names() const;

private:
    std::vector<std::unique_ptr<Validator>> validators_;
};

// Rejects a missing or non-positive shot count.
std::unique_ptr<Validator> make_shots_validator();
// Rejects non-finite encoded or ground-truth phases.
std::unique_ptr<Validator> make_phase_validator();
// Checks noise probabilities and jitter magnitude.
std::unique_ptr<Validator> make_noise_validator();
// Requires a readout model with an invertible confusion matrix.
std::unique_ptr<Validator> make_mitigation_validator();

ValidatorRegistry make_validator_registry_for(const EstimationJobRequest& job);

}  // namespace service
