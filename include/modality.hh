#ifndef TORCH_INC_H_     // Prevent torch
#define TORCH_INC_H_     // from reloading
#include <torch/torch.h> //
#endif                   // End of torch

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "utils/util.hh"

#ifndef CADAVAE_MODALITY_HH_
#define CADAVAE_MODALITY_HH_

namespace cadavae {

const std::string IMG = "IMG";           // instance-level visual features
const std::string CLS_ATTR = "CLS_ATTR"; // class-level attribute vectors

/// modality -> tensor, ordered by the modality name
using tensor_dict_t = std::map<std::string, torch::Tensor>;

/// @returns the sorted list of modality names in the map
template <typename MAP>
std::vector<std::string>
modality_keys(const MAP &dict)
{
    std::vector<std::string> ret;
    ret.reserve(dict.size());
    for (const auto &pp : dict)
        ret.emplace_back(pp.first);
    return ret;
}

/// All modality-keyed maps in one computation must carry exactly the
/// same set of keys.
/// @param expected modality names (sorted)
/// @param dict     the map to check
/// @param tag      name of the map in the error message
template <typename MAP>
void
check_modalities(const std::vector<std::string> &expected,
                 const MAP &dict,
                 const std::string &tag)
{
    const auto keys = modality_keys(dict);

    auto _print = [](const std::vector<std::string> &vec) {
        std::string ret = "{";
        for (std::size_t j = 0; j < vec.size(); ++j)
            ret += (j > 0 ? ", " : "") + vec.at(j);
        return ret + "}";
    };

    ASSERT(keys == expected,
           "modality mismatch in " << tag << ": " << _print(keys) << " vs. "
                                   << _print(expected));
}

/// All unordered pairs (m1, m2) with m1 before m2
std::vector<std::pair<std::string, std::string>>
modality_pairs(const std::vector<std::string> &modalities)
{
    std::vector<std::pair<std::string, std::string>> ret;
    for (std::size_t i = 0; i < modalities.size(); ++i)
        for (std::size_t j = i + 1; j < modalities.size(); ++j)
            ret.emplace_back(modalities.at(i), modalities.at(j));
    return ret;
}

/// Cast each tensor to float and move it to the device
tensor_dict_t
to_device(const tensor_dict_t &x, const torch::Device device)
{
    tensor_dict_t ret;
    for (const auto &pp : x)
        ret[pp.first] = pp.second.to(device, torch::kFloat32);
    return ret;
}

} // namespace
#endif
