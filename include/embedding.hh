#include "cadavae.hh"
#include "cadavae_io.hh"
#include "modality.hh"
#include "utils/util.hh"
#include "utils/std_util.hh"

#include <tuple>

#ifndef CADAVAE_EMBEDDING_HH_
#define CADAVAE_EMBEDDING_HH_

namespace cadavae {

/// Contiguous rows [lb, ub)
struct index_range_t {
    int64_t lb;
    int64_t ub;

    int64_t size() const { return ub - lb; }
};

/// Latent embeddings for the downstream classifier, stacked in the order
/// (seen training, unseen attributes, test)
struct synthetic_dataset_t {
    torch::Tensor embedding; // N x latent
    torch::Tensor label;     // N
    index_range_t train;     // classifier training rows
    index_range_t test;      // classifier test rows

    int64_t size() const { return label.size(0); }
};

struct embedding_options_t {
    bool generalized;
    torch::Device device;
};

/// Encode one modality of all the rows in the block, in order
/// @param model
/// @param data_block
/// @param modality
/// @param device
/// @param with_noise reparameterized sample (true) or latent mean (false)
/// @returns (embedding, label)
template <typename MODEL_PTR, typename DATA_BLOCK>
std::tuple<torch::Tensor, torch::Tensor>
eval_vae(MODEL_PTR model,
         DATA_BLOCK &data_block,
         const std::string &modality,
         const torch::Device device,
         const bool with_noise = true)
{
    using Index = typename DATA_BLOCK::Index;

    model->train(false); // freeze the model
    torch::NoGradGuard no_grad;

    const Index ntot = data_block.ntot();
    const Index batch_size = data_block.size();
    Index nbatch = ntot / batch_size;
    if ((nbatch * batch_size) < ntot) {
        ++nbatch;
    }

    std::vector<torch::Tensor> emb_vec;
    std::vector<torch::Tensor> label_vec;
    std::vector<Index> batch;
    batch.reserve(batch_size);

    for (Index b = 0; b < nbatch; ++b) {

        const Index lb = b * batch_size;
        const Index ub = std::min((b + 1) * batch_size, ntot);

        batch.clear();
        for (Index j = lb; j < ub; ++j) {
            batch.emplace_back(j);
        }

        data_block.read(batch);
        torch::Tensor x =
            data_block.torch_tensor(modality).to(device, torch::kFloat32);
        torch::Tensor y = data_block.torch_labels().to(device);
        data_block.clear();

        auto enc = model->encode(modality, x);

        emb_vec.emplace_back(with_noise ? enc.sample : enc.mean);
        label_vec.emplace_back(y);
    }

    return std::make_tuple(torch::cat(emb_vec, 0), torch::cat(label_vec, 0));
}

/// Class ids -> positions in the class list
/// @param labels raw class ids
/// @param classes class list, e.g., { 7, 12, 19 } -> { 0, 1, 2 }
torch::Tensor
remap_labels(torch::Tensor labels, const std::vector<int64_t> &classes)
{
    const auto class2pos = make_position_dict<int64_t, int64_t>(classes);

    torch::Tensor _labels = labels.to(torch::kCPU, torch::kLong).contiguous();
    torch::Tensor ret = torch::empty_like(_labels);

    const int64_t *src = _labels.data_ptr<int64_t>();
    int64_t *dst = ret.data_ptr<int64_t>();

    for (int64_t j = 0; j < _labels.numel(); ++j) {
        ASSERT(class2pos.count(src[j]) > 0,
               "class " << src[j] << " is not in the class list");
        dst[j] = class2pos.at(src[j]);
    }

    return ret.to(labels.device());
}

/// Synthetic dataset for the zero-shot classifier
///
/// 1. generalized only: noisy IMG embeddings of the seen training rows
/// 2. noisy CLS_ATTR embeddings of the unseen classes
/// 3. IMG latent means of the test rows
///
/// Without the generalized setting, the unseen attribute labels are
/// remapped to positions in the unseen class list; test rows keep their
/// class ids.
template <typename MODEL_PTR, typename DATA_BLOCK>
synthetic_dataset_t
generate_synthetic_dataset(MODEL_PTR model,
                           DATA_BLOCK &seen_block,
                           DATA_BLOCK &unseen_attr_block,
                           DATA_BLOCK &test_block,
                           const std::vector<int64_t> &unseen_classes,
                           const embedding_options_t &opt)
{
    TLOG("ZSL embedding generation");

    model->to(opt.device);
    model->train(false);

    torch::Tensor emb_seen, label_seen;

    if (opt.generalized) {
        std::tie(emb_seen, label_seen) =
            eval_vae(model, seen_block, IMG, opt.device);
    } else {
        auto _float = torch::TensorOptions()
                          .dtype(torch::kFloat32)
                          .device(opt.device);
        auto _long =
            torch::TensorOptions().dtype(torch::kLong).device(opt.device);
        emb_seen = torch::empty({ 0, model->dim_latent() }, _float);
        label_seen = torch::empty({ 0 }, _long);
    }

    torch::Tensor emb_attr, label_attr;
    std::tie(emb_attr, label_attr) =
        eval_vae(model, unseen_attr_block, CLS_ATTR, opt.device);

    torch::Tensor emb_test, label_test;
    std::tie(emb_test, label_test) =
        eval_vae(model, test_block, IMG, opt.device, false);

    if (!opt.generalized) {
        label_attr = remap_labels(label_attr, unseen_classes);
    }

    synthetic_dataset_t ret;
    ret.embedding = torch::cat({ emb_seen, emb_attr, emb_test }, 0);
    ret.label = torch::cat({ label_seen, label_attr, label_test }, 0);

    const int64_t n_train = label_seen.size(0) + label_attr.size(0);
    ret.train = index_range_t { 0, n_train };
    ret.test = index_range_t { n_train, n_train + label_test.size(0) };

    TLOG("Synthetic dataset: " << ret.size() << " x " << ret.embedding.size(1)
                               << " (train: " << ret.train.size()
                               << ", test: " << ret.test.size() << ")");

    return ret;
}

/// ${hdr}.zsl_emb.gz, ${hdr}.zsl_label.gz, ${hdr}.zsl_split.gz
void
write_synthetic_dataset(const std::string hdr, const synthetic_dataset_t &ds)
{
    write_tensor(hdr + ".zsl_emb.gz", ds.embedding);

    torch::Tensor _label = ds.label.to(torch::kCPU, torch::kLong).contiguous();
    std::vector<int64_t> labels(_label.data_ptr<int64_t>(),
                                _label.data_ptr<int64_t>() + _label.numel());
    write_vector_file(hdr + ".zsl_label.gz", labels);

    std::vector<std::tuple<std::string, std::string>> split;
    split.emplace_back("train",
                       std::to_string(ds.train.lb) + " " +
                           std::to_string(ds.train.ub));
    split.emplace_back("test",
                       std::to_string(ds.test.lb) + " " +
                           std::to_string(ds.test.ub));
    write_pair_file(hdr + ".zsl_split.gz", split);
}

} // namespace
#endif
