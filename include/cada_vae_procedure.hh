#include "cadavae.hh"
#include "cadavae_io.hh"
#include "cadavae_alg.hh"
#include "embedding.hh"
#include "registry.hh"
#include "warmup.hh"
#include "models/cada_vae.hh"

#ifndef CADAVAE_PROCEDURE_HH_
#define CADAVAE_PROCEDURE_HH_

namespace cadavae {

/// Everything a zero-shot training procedure reads
struct zsl_config_t {
    cadavae_options_t main;
    training_options_t train;
    cada_vae_options_t network;
    warmup_options_t warmup;
};

struct zsl_result_t {
    synthetic_dataset_t dataset;
    std::vector<epoch_loss_t> history;
};

using zsl_procedure_t =
    std::function<zsl_result_t(const zsl_config_t &, const zsl_data_t &)>;

using zsl_registry_t = procedure_registry_t<zsl_procedure_t>;

/// Train a CADA-VAE on the seen classes and generate the synthetic
/// embedding dataset
zsl_result_t
cada_vae_train_procedure(const zsl_config_t &cfg, const zsl_data_t &data)
{
    torch::manual_seed(cfg.train.seed);

    const warmup_spec_t warmup = make_warmup_spec(cfg.warmup);
    const int64_t batch_size = cfg.main.batch_size;

    dense_data_block_t train_block = make_train_block(data, batch_size);

    TLOG("Building CADA-VAE model");

    cada_vae_t model(make_modality_specs(cfg.network,
                                         train_block.nfeature(IMG),
                                         train_block.nfeature(CLS_ATTR)),
                     latent_dim(cfg.network.latent),
                     cfg.network.do_bn);

    model->pretty_print(std::cerr);
    std::cerr << std::endl;

    torch::optim::Adam adam(model->parameters(),
                            torch::optim::AdamOptions(cfg.train.lr)
                                .amsgrad(true));

    cada_vae_trainer_t<cada_vae_t, torch::optim::Adam> trainer(model,
                                                               adam,
                                                               cfg.train,
                                                               warmup);

    zsl_result_t ret;
    ret.history = trainer.run(train_block);

    dense_data_block_t unseen_block =
        make_unseen_attr_block(data, cfg.main.unseen_samples, batch_size);
    dense_data_block_t test_block = make_test_block(data, batch_size);

    const embedding_options_t emb_opt { cfg.main.generalized,
                                        cfg.train.device };

    ret.dataset = generate_synthetic_dataset(model,
                                             train_block,
                                             unseen_block,
                                             test_block,
                                             data.unseen,
                                             emb_opt);
    return ret;
}

/// All the procedures this build knows about
zsl_registry_t
make_zsl_registry()
{
    zsl_registry_t ret;
    ret.add("cada_vae", cada_vae_train_procedure);
    return ret;
}

} // namespace
#endif
