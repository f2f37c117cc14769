#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "cadavae_io.hh"
#include "cadavae_alg.hh"
#include "models/cada_vae.hh"

#include <cstdio>
#include <cstdlib>
#include <limits>

using namespace cadavae;

namespace {

dense_data_block_t
make_block(const Index n, const Index batch_size)
{
    Mat img = Mat::Random(n, 6);
    Mat attr = Mat::Random(n, 3);
    std::vector<int64_t> labels(n);
    for (Index j = 0; j < n; ++j)
        labels[j] = j % 3;

    dense_data_block_t::data_map_t dmap;
    dmap[IMG] = img;
    dmap[CLS_ATTR] = attr;
    return dense_data_block_t(dmap, labels, batch_size);
}

cada_vae_t
make_small_model(const bool do_bn = false)
{
    std::vector<modality_spec_t> specs { { IMG, 6, { 8 }, { 8 } },
                                         { CLS_ATTR, 3, { 5 }, { 5 } } };
    return cada_vae_t(specs, latent_dim(4), do_bn);
}

training_options_t
cpu_options(const int64_t max_epoch)
{
    training_options_t opt;
    opt.max_epoch = max_epoch;
    opt.lr = 1e-3;
    opt.device = torch::Device(torch::kCPU);
    opt.seed = 7;
    return opt;
}

warmup_spec_t
short_warmup()
{
    return warmup_spec_t { warmup_ramp_t(0, 4, 0.25),
                           warmup_ramp_t(1, 3, 2.),
                           warmup_ramp_t(0, 2, 1.) };
}

using trainer_t = cada_vae_trainer_t<cada_vae_t, torch::optim::Adam>;

/// running mean and variance of every decoder batch-norm layer
std::vector<torch::Tensor>
decoder_running_stats(cada_vae_t model)
{
    std::vector<torch::Tensor> ret;
    for (const auto &pp : model->named_buffers())
        if (pp.key().find("decoder_") == 0 &&
            pp.key().find("running_") != std::string::npos)
            ret.emplace_back(pp.value().clone());
    return ret;
}

/// one epoch of a BN model from a fixed starting point
std::vector<torch::Tensor>
train_bn_one_epoch(const bool cross_inference)
{
    torch::manual_seed(23);
    std::srand(23);
    dense_data_block_t block = make_block(8, 8); // one batch
    cada_vae_t model = make_small_model(true);
    torch::optim::Adam adam(model->parameters(),
                            torch::optim::AdamOptions(1e-3));
    training_options_t opt = cpu_options(1);
    opt.cross_inference = cross_inference;
    trainer_t trainer(model, adam, opt, short_warmup());
    trainer.run(block);
    return decoder_running_stats(model);
}

} // namespace

TEST_CASE("one run of the training loop", "[training]")
{
    torch::manual_seed(21);

    dense_data_block_t block = make_block(20, 8); // partial last batch
    cada_vae_t model = make_small_model();
    torch::optim::Adam adam(model->parameters(),
                            torch::optim::AdamOptions(1e-3).amsgrad(true));

    std::vector<torch::Tensor> before;
    for (const auto &p : model->parameters())
        before.emplace_back(p.detach().clone());

    const warmup_spec_t warmup = short_warmup();
    trainer_t trainer(model, adam, cpu_options(4), warmup);
    CHECK(trainer.state() == training_state_t::INITIALIZED);

    const auto &history = trainer.run(block);

    CHECK(trainer.state() == training_state_t::FINISHED);
    REQUIRE(history.size() == 4);
    CHECK(trainer.history().size() == 4);

    for (std::size_t e = 0; e < history.size(); ++e) {
        const epoch_loss_t &ll = history.at(e);
        const loss_factors_t f = loss_factors(e, warmup);
        CHECK(ll.epoch == static_cast<int64_t>(e));
        CHECK(ll.factors.beta == Approx(f.beta));
        CHECK(ll.factors.cross_reconstruction ==
              Approx(f.cross_reconstruction));
        CHECK(ll.factors.distance == Approx(f.distance));
        CHECK(std::isfinite(ll.loss));
        CHECK(std::isfinite(ll.vae));
        CHECK(ll.ca >= 0.f);
        CHECK(ll.da >= 0.f);
    }

    // no cross-alignment before the ramp starts
    CHECK(history.at(0).ca == 0.f);

    bool changed = false;
    const auto after = model->parameters();
    for (std::size_t j = 0; j < before.size(); ++j)
        changed = changed || !torch::equal(before.at(j), after.at(j));
    CHECK(changed);

    CHECK_THROWS_AS(trainer.run(block), fatal_error);
}

TEST_CASE("a non-finite loss stops the run", "[training]")
{
    torch::manual_seed(22);

    Mat img = Mat::Zero(4, 6);
    img(1, 2) = std::numeric_limits<float>::quiet_NaN();
    dense_data_block_t::data_map_t dmap;
    dmap[IMG] = img;
    dmap[CLS_ATTR] = Mat::Zero(4, 3);
    dense_data_block_t block(dmap, { 0, 1, 2, 3 }, 4);

    cada_vae_t model = make_small_model();
    torch::optim::Adam adam(model->parameters(), torch::optim::AdamOptions(1e-3));
    trainer_t trainer(model, adam, cpu_options(2), short_warmup());

    CHECK_THROWS_AS(trainer.run(block), fatal_error);
    CHECK(trainer.state() == training_state_t::EPOCH_RUNNING);
}

TEST_CASE("an unknown norm is rejected before training", "[training]")
{
    cada_vae_t model = make_small_model();
    torch::optim::Adam adam(model->parameters(), torch::optim::AdamOptions(1e-3));
    training_options_t opt = cpu_options(1);
    opt.recon_norm = "l0";

    CHECK_THROWS_AS(trainer_t(model, adam, opt, short_warmup()), fatal_error);
}

TEST_CASE("training options from the command line", "[training]")
{
    const char *argv[] = { "cada_vae", "--lr",    "0.01",       "--max_epoch",
                           "7",        "--norm",  "l2",         "--no_cross",
                           "--cpu",    "--cross_train_mode" };
    const int argc = sizeof(argv) / sizeof(argv[0]);

    training_options_t opt;
    REQUIRE(parse_training_options(argc, argv, opt) == EXIT_SUCCESS);
    CHECK(opt.lr == Approx(0.01));
    CHECK(opt.max_epoch == 7);
    CHECK(opt.recon_norm == "l2");
    CHECK_FALSE(opt.cross_reconstruction);
    CHECK(opt.distribution_alignment);
    CHECK_FALSE(opt.cross_inference);
    CHECK(opt.device.type() == torch::kCPU);

    const char *bad[] = { "cada_vae", "--norm", "cosine" };
    training_options_t opt_bad;
    CHECK(parse_training_options(3, bad, opt_bad) == EXIT_FAILURE);
}

TEST_CASE("loss history has one row per epoch", "[training]")
{
    std::vector<epoch_loss_t> history;
    history.push_back(epoch_loss_t { 0, 1., 1., 0., 0., { 0., 0., 0. } });
    history.push_back(epoch_loss_t { 1, .5, .4, .05, .05, { .1, .2, .3 } });

    const std::string file = "training_test_history.gz";
    write_loss_history(file, history);

    Mat out;
    REQUIRE(read_data_file(file, out) == EXIT_SUCCESS);
    REQUIRE(out.rows() == 2);
    REQUIRE(out.cols() == 8);
    CHECK(out(0, 0) == Approx(1.));
    CHECK(out(1, 0) == Approx(2.));
    CHECK(out(1, 1) == Approx(.5));
    CHECK(out(1, 7) == Approx(.3));
    std::remove(file.c_str());
}

TEST_CASE("batch boundaries", "[training]")
{
    using bounds_t = std::vector<std::pair<int64_t, int64_t>>;

    CHECK(make_batch_bounds(8, 4, false) == bounds_t { { 0, 4 }, { 4, 8 } });
    CHECK(make_batch_bounds(10, 4, false) ==
          bounds_t { { 0, 4 }, { 4, 8 }, { 8, 10 } });
    CHECK(make_batch_bounds(9, 4, false) ==
          bounds_t { { 0, 4 }, { 4, 8 }, { 8, 9 } });
    CHECK(make_batch_bounds(9, 4, true) == bounds_t { { 0, 4 }, { 4, 9 } });
    CHECK(make_batch_bounds(1, 4, true) == bounds_t { { 0, 1 } });
}

TEST_CASE("batch normalization never sees a single-row batch", "[training]")
{
    torch::manual_seed(24);

    SECTION("a one-row tail is merged")
    {
        dense_data_block_t block = make_block(9, 4);
        cada_vae_t model = make_small_model(true);
        torch::optim::Adam adam(model->parameters(),
                                torch::optim::AdamOptions(1e-3));
        trainer_t trainer(model, adam, cpu_options(2), short_warmup());

        CHECK_NOTHROW(trainer.run(block));
        CHECK(trainer.state() == training_state_t::FINISHED);
        CHECK(trainer.history().size() == 2);
    }

    SECTION("one-row batches are rejected up front")
    {
        dense_data_block_t block = make_block(9, 1);
        cada_vae_t model = make_small_model(true);
        torch::optim::Adam adam(model->parameters(),
                                torch::optim::AdamOptions(1e-3));
        trainer_t trainer(model, adam, cpu_options(1), short_warmup());

        CHECK_THROWS_AS(trainer.run(block), fatal_error);
        CHECK(trainer.state() == training_state_t::INITIALIZED);
    }
}

TEST_CASE("the cross-decoding mode reaches the training loop", "[training]")
{
    const auto inference_1 = train_bn_one_epoch(true);
    const auto inference_2 = train_bn_one_epoch(true);
    const auto train_mode = train_bn_one_epoch(false);

    REQUIRE(inference_1.size() > 0);
    REQUIRE(inference_1.size() == inference_2.size());
    REQUIRE(inference_1.size() == train_mode.size());

    // same seeds, same mode: same statistics
    for (std::size_t j = 0; j < inference_1.size(); ++j)
        CHECK(torch::allclose(inference_1.at(j), inference_2.at(j)));

    // training-mode cross decoding updates the running statistics again
    bool changed = false;
    for (std::size_t j = 0; j < inference_1.size(); ++j)
        changed = changed || !torch::allclose(inference_1.at(j),
                                              train_mode.at(j));
    CHECK(changed);
}

TEST_CASE("a fixed seed reproduces the run", "[training]")
{
    auto _run = []() {
        torch::manual_seed(25);
        std::srand(25);
        dense_data_block_t block = make_block(20, 6);
        cada_vae_t model = make_small_model();
        torch::optim::Adam adam(model->parameters(),
                                torch::optim::AdamOptions(1e-3));
        trainer_t trainer(model, adam, cpu_options(3), short_warmup());
        return trainer.run(block);
    };

    const std::vector<epoch_loss_t> h1 = _run();
    const std::vector<epoch_loss_t> h2 = _run();

    REQUIRE(h1.size() == h2.size());
    for (std::size_t e = 0; e < h1.size(); ++e) {
        CHECK(h1.at(e).loss == Approx(h2.at(e).loss));
        CHECK(h1.at(e).vae == Approx(h2.at(e).vae));
    }

    const char *argv[] = { "cada_vae", "--seed", "42" };
    training_options_t opt;
    REQUIRE(parse_training_options(3, argv, opt) == EXIT_SUCCESS);
    CHECK(opt.seed == 42u);
}

TEST_CASE("the data block must match the model", "[training]")
{
    cada_vae_t model = make_small_model();
    torch::optim::Adam adam(model->parameters(), torch::optim::AdamOptions(1e-3));

    SECTION("missing modality")
    {
        dense_data_block_t::data_map_t dmap;
        dmap[IMG] = Mat::Random(4, 6);
        dense_data_block_t block(dmap, { 0, 1, 2, 3 }, 2);
        trainer_t trainer(model, adam, cpu_options(1), short_warmup());
        CHECK_THROWS_AS(trainer.run(block), fatal_error);
    }

    SECTION("wrong feature dimension")
    {
        dense_data_block_t::data_map_t dmap;
        dmap[IMG] = Mat::Random(4, 5);
        dmap[CLS_ATTR] = Mat::Random(4, 3);
        dense_data_block_t block(dmap, { 0, 1, 2, 3 }, 2);
        trainer_t trainer(model, adam, cpu_options(1), short_warmup());
        CHECK_THROWS_AS(trainer.run(block), fatal_error);
    }
}
