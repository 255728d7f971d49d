// include/alm/training/state.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include "../core/tensor.hpp"

namespace alm {

using StateDict = std::map<std::string, Tensor>;

class Stateful {
public:
    virtual ~Stateful() = default;
    virtual StateDict state_dict() const = 0;
    virtual void load_state_dict(const StateDict& state, bool strict = true) = 0;
};

// Named parameters of a model
class ParameterDict : public Stateful {
public:
    ParameterDict() = default;

    Tensor& register_parameter(const std::string& name, Tensor value);
    Tensor& parameter(const std::string& name);
    const Tensor& parameter(const std::string& name) const;
    bool contains(const std::string& name) const { return parameters_.count(name) > 0; }

    std::vector<Tensor*> parameters();
    const std::map<std::string, Tensor>& named_parameters() const { return parameters_; }

    StateDict state_dict() const override;

    // Copies values into the registered parameters. Shapes must match; with
    // strict, the key sets must match too.
    void load_state_dict(const StateDict& state, bool strict = true) override;

private:
    std::map<std::string, Tensor> parameters_;
};

// Deep copy without gradient buffers
StateDict copy_state(const StateDict& state);

// Loads `state` into `module` for the lifetime of the object, then puts the
// previous state back.
class StateSwap {
public:
    StateSwap(Stateful& module, const StateDict& state, bool strict = true);
    ~StateSwap();

    StateSwap(const StateSwap&) = delete;
    StateSwap& operator=(const StateSwap&) = delete;

private:
    Stateful& module_;
    StateDict saved_;
};

void save_state_dict(const StateDict& state, const std::string& path);
StateDict load_state_dict_file(const std::string& path);

} // namespace alm
