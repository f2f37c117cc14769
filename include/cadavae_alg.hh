#include "cadavae.hh"
#include "cadavae_io.hh"
#include "modality.hh"
#include "warmup.hh"
#include "losses.hh"
#include "utils/util.hh"
#include "utils/std_util.hh"
#include <random>
#include <cstdint>
#include <utility>
#include <cmath>

#include <getopt.h>

#ifndef CADAVAE_ALG_HH_
#define CADAVAE_ALG_HH_

struct training_options_t {

    explicit training_options_t()
        : device(torch::cuda::is_available() ? torch::kCUDA : torch::kCPU)
    {
        lr = 1.5e-4;
        max_epoch = 100;
        recon_norm = "l1";
        cross_reconstruction = true;
        distribution_alignment = true;
        cross_inference = true;
        seed = std::random_device {}();
    }

    float lr;               // 1.5e-4
    int64_t max_epoch;      // 100
    std::string recon_norm; // l1 or l2

    bool cross_reconstruction;   // add the cross-alignment loss
    bool distribution_alignment; // add the distribution-alignment loss
    bool cross_inference;        // cross-decode in the inference mode

    uint32_t seed; // row shuffling and torch RNG

    torch::Device device;
};

int
parse_training_options(const int argc,
                       const char *_argv[],
                       training_options_t &options)
{
    const char *_usage =
        "[Training algorithm options]\n"
        "\n"
        "--lr               : learning rate (default: 1.5e-4)\n"
        "--max_epoch        : maximum #epoch (default: 100)\n"
        "--norm             : reconstruction norm, l1 or l2 (default: l1)\n"
        "--no_cross         : drop the cross-alignment loss\n"
        "--no_distance      : drop the distribution-alignment loss\n"
        "--cross_train_mode : cross-decode in the training mode\n"
        "                   : (default: inference mode)\n"
        "--cpu              : train on CPU even if CUDA is available\n"
        "--seed             : random seed (default: from random_device)\n"
        "\n";

    const char *const short_opts = "L:E:N:xdtcr:h";

    const option long_opts[] = {
        { "lr", required_argument, nullptr, 'L' },               //
        { "learning_rate", required_argument, nullptr, 'L' },    //
        { "max_epoch", required_argument, nullptr, 'E' },        //
        { "epoch", required_argument, nullptr, 'E' },            //
        { "norm", required_argument, nullptr, 'N' },             //
        { "recon_norm", required_argument, nullptr, 'N' },       //
        { "no_cross", no_argument, nullptr, 'x' },               //
        { "no-cross", no_argument, nullptr, 'x' },               //
        { "no_distance", no_argument, nullptr, 'd' },            //
        { "no-distance", no_argument, nullptr, 'd' },            //
        { "cross_train_mode", no_argument, nullptr, 't' },       //
        { "cpu", no_argument, nullptr, 'c' },                    //
        { "seed", required_argument, nullptr, 'r' },             //
        { "help", no_argument, nullptr, 'h' },                   //
        { nullptr, no_argument, nullptr, 0 }
    };

    optind = 1;
    opterr = 0;

    // copy argv and run over this instead of dealing with the actual ones.
    std::vector<const char *> _argv_org(_argv, _argv + argc);
    std::vector<const char *> argv_copy;
    std::transform(std::begin(_argv_org),
                   std::end(_argv_org),
                   std::back_inserter(argv_copy),
                   str2char);

    const char **argv = &argv_copy[0];

    while (true) {
        const auto opt = getopt_long(argc,                      //
                                     const_cast<char **>(argv), //
                                     short_opts,                //
                                     long_opts,                 //
                                     nullptr);

        if (-1 == opt)
            break;

        switch (opt) {
        case 'L':
            options.lr = std::stof(optarg);
            break;

        case 'E':
            options.max_epoch = std::stol(optarg);
            break;

        case 'N':
            options.recon_norm = std::string(optarg);
            break;

        case 'x':
            options.cross_reconstruction = false;
            break;

        case 'd':
            options.distribution_alignment = false;
            break;

        case 't':
            options.cross_inference = false;
            break;

        case 'c':
            options.device = torch::Device(torch::kCPU);
            break;

        case 'r':
            options.seed = static_cast<uint32_t>(std::stoul(optarg));
            break;

        case 'h': // -h or --help
            std::cerr << _usage << std::endl;
            break;

        case '?': // Unrecognized option
        default:  //
                 ;
        }
    }

    for (std::size_t i = 0; i < argv_copy.size(); i++)
        delete[] argv_copy[i];

    ERR_RET(options.max_epoch < 1, "need a positive --max_epoch");
    ERR_RET(options.lr <= 0., "need a positive --lr");
    ERR_RET(options.recon_norm != "l1" && options.recon_norm != "l2",
            "--norm must be l1 or l2: " << options.recon_norm);

    return EXIT_SUCCESS;
}

namespace cadavae {

/// Batch boundaries [lb, ub) over `ntot` rows
///
/// The last batch may be partial. With `merge_single_tail` a one-row tail
/// is folded into the previous batch, since batch normalization in the
/// training mode needs two rows or more.
std::vector<std::pair<int64_t, int64_t>>
make_batch_bounds(const int64_t ntot,
                  const int64_t batch_size,
                  const bool merge_single_tail)
{
    ASSERT(batch_size > 0, "need a positive batch size");
    std::vector<std::pair<int64_t, int64_t>> ret;
    for (int64_t lb = 0; lb < ntot; lb += batch_size) {
        ret.emplace_back(lb, std::min(lb + batch_size, ntot));
    }
    if (merge_single_tail && ret.size() > 1 &&
        (ret.back().second - ret.back().first) == 1) {
        const int64_t ub = ret.back().second;
        ret.pop_back();
        ret.back().second = ub;
    }
    return ret;
}

/// Per-epoch averages over the batches
struct epoch_loss_t {
    int64_t epoch;
    float loss; // optimized (combined) loss
    float vae;  // recon - beta * KL
    float ca;   // cross alignment x cross-reconstruction factor
    float da;   // distribution alignment x distance factor
    loss_factors_t factors;
};

enum class training_state_t {
    INITIALIZED,
    EPOCH_RUNNING,
    EPOCH_COMPLETE,
    FINISHED
};

/// Warm-up scheduled CADA-VAE training
///
/// One run: for each epoch, shuffle the rows, and for each batch
/// forward -> loss -> zero_grad -> backward -> step.
/// A non-finite loss stops the run.
template <typename MODEL_PTR, typename OPTIM>
struct cada_vae_trainer_t {

    explicit cada_vae_trainer_t(MODEL_PTR _model,
                                OPTIM &_optim,
                                const training_options_t &_opt,
                                const warmup_spec_t &_warmup)
        : model(_model)
        , optim(_optim)
        , opt(_opt)
        , warmup(_warmup)
        , norm(parse_recon_norm(_opt.recon_norm))
        , loss_opt { _opt.cross_reconstruction, _opt.distribution_alignment }
        , rng(_opt.seed)
        , _state(training_state_t::INITIALIZED)
    {
    }

    template <typename DATA_BLOCK>
    const std::vector<epoch_loss_t> &run(DATA_BLOCK &data_block)
    {
        ASSERT(_state == training_state_t::INITIALIZED,
               "this trainer has already run");

        TLOG("Training on "
             << (opt.device.type() == torch::kCUDA ? "GPU" : "CPU"));

        ASSERT(data_block.modalities() == model->modalities(),
               "the data block and the model disagree on the modalities");
        for (const auto &m : model->modalities()) {
            ASSERT(data_block.nfeature(m) == model->dim_data(m),
                   m << " has " << data_block.nfeature(m)
                     << " features; the model expects "
                     << model->dim_data(m));
        }

        const int64_t ntot = data_block.ntot();
        const int64_t batch_size = data_block.size();

        ASSERT(!model->do_bn || (batch_size > 1 && ntot > 1),
               "batch normalization needs two rows or more per batch");

        const auto bounds = make_batch_bounds(ntot, batch_size, model->do_bn);

        TLOG("Batch size = " << batch_size << ", "
                             << "Number of batches = " << bounds.size()
                             << ", seed = " << opt.seed);

        model->to(opt.device);
        model->train(true);

        for (int64_t epoch = 0; epoch < opt.max_epoch; ++epoch) {
            _state = training_state_t::EPOCH_RUNNING;
            _history.emplace_back(run_epoch(data_block, epoch, bounds));
            _state = training_state_t::EPOCH_COMPLETE;

            const epoch_loss_t &ll = _history.back();
            TLOG("[" << zeropad(epoch + 1, opt.max_epoch) << "] "
                     << "loss: " << std::setw(12) << ll.loss << ", "
                     << "vae: " << std::setw(12) << ll.vae << ", "
                     << "ca: " << std::setw(12) << ll.ca << ", "
                     << "da: " << std::setw(12) << ll.da << " "
                     << "(beta=" << ll.factors.beta << ", "
                     << "cross=" << ll.factors.cross_reconstruction << ", "
                     << "distance=" << ll.factors.distance << ")");
        }

        _state = training_state_t::FINISHED;
        TLOG("Done training");
        return _history;
    }

    training_state_t state() const { return _state; }
    const std::vector<epoch_loss_t> &history() const { return _history; }

private:
    template <typename DATA_BLOCK>
    epoch_loss_t
    run_epoch(DATA_BLOCK &data_block,
              const int64_t epoch,
              const std::vector<std::pair<int64_t, int64_t>> &bounds)
    {
        using Index = typename DATA_BLOCK::Index;

        const Index ntot = data_block.ntot();
        const int64_t nbatch = bounds.size();

        const loss_factors_t factors = loss_factors(epoch, warmup);

        const std::vector<Index> order = random_order(ntot, rng);
        std::vector<Index> batch;

        double loss_accum = 0., vae_accum = 0., ca_accum = 0., da_accum = 0.;

        for (int64_t b = 0; b < nbatch; ++b) {

            const Index lb = bounds.at(b).first;
            const Index ub = bounds.at(b).second;

            batch.clear();
            for (Index j = lb; j < ub; ++j) {
                batch.emplace_back(order.at(j));
            }

            data_block.read(batch);
            tensor_dict_t x = to_device(data_block.torch_tensor_dict(),
                                        opt.device);
            data_block.clear();

            auto y = model->forward(x);

            auto losses =
                compute_cada_losses(model->decoder_functions(
                                        opt.cross_inference),
                                    x,
                                    y.recon,
                                    y.mean,
                                    y.lnvar,
                                    y.sample,
                                    factors.beta,
                                    norm);

            auto loss = combine_cada_losses(losses, factors, loss_opt);

            const float _loss_batch = loss.template item<float>();

            ASSERT(std::isfinite(_loss_batch),
                   "non-finite loss " << _loss_batch << " at epoch "
                                      << (epoch + 1) << ", batch " << (b + 1));

            optim.zero_grad();
            loss.backward();
            optim.step();

            loss_accum += _loss_batch;
            vae_accum += losses.vae.template item<float>();
            ca_accum += losses.ca.template item<float>() *
                factors.cross_reconstruction;
            da_accum += losses.da.template item<float>() * factors.distance;

            std::cerr << "\r[" << std::setw(20) << (b + 1) << "] ";
            std::cerr << std::setw(20) << _loss_batch;
        }

        std::cerr << "\r";

        const double n = static_cast<double>(nbatch);

        epoch_loss_t ret;
        ret.epoch = epoch;
        ret.loss = loss_accum / n;
        ret.vae = vae_accum / n;
        ret.ca = ca_accum / n;
        ret.da = da_accum / n;
        ret.factors = factors;
        return ret;
    }

    MODEL_PTR model;
    OPTIM &optim;
    const training_options_t opt;
    const warmup_spec_t warmup;
    const recon_norm_t norm;
    const cada_loss_options_t loss_opt;

    std::mt19937 rng;
    training_state_t _state;
    std::vector<epoch_loss_t> _history;
};

/// epoch, loss, vae, ca, da, beta, cross, distance
void
write_loss_history(const std::string file_,
                   const std::vector<epoch_loss_t> &history)
{
    Mat out(history.size(), 8);
    for (std::size_t j = 0; j < history.size(); ++j) {
        const epoch_loss_t &ll = history.at(j);
        out.row(j) << static_cast<float>(ll.epoch + 1), ll.loss, ll.vae,
            ll.ca, ll.da, ll.factors.beta, ll.factors.cross_reconstruction,
            ll.factors.distance;
    }
    write_data_file(file_, out);
}

} // namespace
#endif
