#ifndef TORCH_INC_H_     // Prevent torch
#define TORCH_INC_H_     // from reloading
#include <torch/torch.h> //
#endif                   // End of torch

#include "utils/util.hh"
#include "utils/std_util.hh"
#include "modality.hh"
#include "losses.hh"
#include <getopt.h>
#include <cstring>
#include <map>
#include <memory>

#ifndef CADAVAE_MODEL_HH_
#define CADAVAE_MODEL_HH_

namespace cadavae {

const char *_model_desc =
    "[Cross- and Distribution-Aligned VAE]\n"
    "\n"
    "For each modality m:\n"
    "\n"
    "  (μ_m, ln σ²_m) = encoder_m(x_m)\n"
    "  z_m = μ_m + σ_m ε,   ε ~ N(0, I)\n"
    "  x_m ≈ decoder_m(z_m)\n"
    "\n"
    "Modalities are aligned by cross reconstruction,\n"
    "x_m ≈ decoder_m(z_k), and by the 2-Wasserstein distance\n"
    "between N(μ_m, σ²_m) and N(μ_k, σ²_k).\n"
    "\n";

///////////////////////
// define dimensions //
///////////////////////

using pos_size_t = check_positive_t<int64_t>;

#define DIM(V)                      \
    struct V : pos_size_t {         \
        explicit V(const int64_t x) \
            : pos_size_t(x)         \
        {                           \
        }                           \
    };

DIM(data_dim);
DIM(latent_dim);
DIM(encoder_h_dim);
DIM(decoder_h_dim);

//////////////////////////
// command line parsing //
//////////////////////////

struct cada_vae_options_t {

    explicit cada_vae_options_t()
    {
        // default options
        latent = 64;
        img_encoding_layers = { 1560 };
        img_decoding_layers = { 1660 };
        attr_encoding_layers = { 1450 };
        attr_decoding_layers = { 665 };
        do_bn = false;
    }

    int64_t latent;
    std::vector<int64_t> img_encoding_layers;
    std::vector<int64_t> img_decoding_layers;
    std::vector<int64_t> attr_encoding_layers;
    std::vector<int64_t> attr_decoding_layers;
    bool do_bn;
};

int
parse_cada_vae_options(const int argc,
                       const char *_argv[],
                       cada_vae_options_t &options)
{
    const char *_usage =
        "[CADA-VAE network options]\n"
        "\n"
        "--latent        : latent z's dim (default: 64)\n"
        "--img_encoding  : dims for image encoding layers (default: 1560)\n"
        "--img_decoding  : dims for image decoding layers (default: 1660)\n"
        "--attr_encoding : dims for attribute encoding layers (default: 1450)\n"
        "--attr_decoding : dims for attribute decoding layers (default: 665)\n"
        "--no_bn         : no batch normalization (default)\n"
        "--bn            : batch normalization after each hidden layer\n"
        "\n";

    const char *const short_opts = "z:E:D:e:d:Bbh";

    const option long_opts[] = {
        { "latent", required_argument, nullptr, 'z' },        //
        { "img_encoding", required_argument, nullptr, 'E' },  //
        { "img-encoding", required_argument, nullptr, 'E' },  //
        { "img_decoding", required_argument, nullptr, 'D' },  //
        { "img-decoding", required_argument, nullptr, 'D' },  //
        { "attr_encoding", required_argument, nullptr, 'e' }, //
        { "attr-encoding", required_argument, nullptr, 'e' }, //
        { "attr_decoding", required_argument, nullptr, 'd' }, //
        { "attr-decoding", required_argument, nullptr, 'd' }, //
        { "bn", no_argument, nullptr, 'B' },                  //
        { "no_bn", no_argument, nullptr, 'b' },               //
        { "no-bn", no_argument, nullptr, 'b' },               //
        { "help", no_argument, nullptr, 'h' },                //
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
        case 'z':
            options.latent = std::stol(optarg);
            break;

        case 'E':
            options.img_encoding_layers = split_int_arr(std::string(optarg));
            break;

        case 'D':
            options.img_decoding_layers = split_int_arr(std::string(optarg));
            break;

        case 'e':
            options.attr_encoding_layers = split_int_arr(std::string(optarg));
            break;

        case 'd':
            options.attr_decoding_layers = split_int_arr(std::string(optarg));
            break;

        case 'B':
            options.do_bn = true;
            break;

        case 'b':
            options.do_bn = false;
            break;

        case 'h': // -h or --help
            std::cerr << _model_desc << std::endl;
            std::cerr << _usage << std::endl;
            break;

        case '?': // Unrecognized option
            break;

        default: //
                 ;
        }
    }

    for (std::size_t i = 0; i < argv_copy.size(); i++)
        delete[] argv_copy[i];

    return EXIT_SUCCESS;
}

/////////////
// encoder //
/////////////

struct encoder_out_t {
    torch::Tensor mean;
    torch::Tensor lnvar;
    torch::Tensor sample;
};

struct encoder_tImpl : torch::nn::Module {

    explicit encoder_tImpl(const data_dim,
                           const std::vector<encoder_h_dim>,
                           const latent_dim,
                           const bool);

    encoder_out_t forward(torch::Tensor x);

    const int64_t x_dim;
    const int64_t z_dim;
    const bool do_bn;

    torch::Tensor reparameterize(torch::Tensor mu, torch::Tensor lnvar);

    torch::nn::Sequential enc { nullptr };
    torch::nn::Linear z_repr_mean { nullptr };
    torch::nn::Linear z_repr_lnvar { nullptr };
};

encoder_tImpl::encoder_tImpl(const data_dim _xd,
                             const std::vector<encoder_h_dim> _eh_vec,
                             const latent_dim _zd,
                             const bool _do_bn)
    : x_dim(_xd.val)
    , z_dim(_zd.val)
    , do_bn(_do_bn)
{
    enc = register_module("encoding", torch::nn::Sequential());

    // Add hidden layers between x and representation
    int64_t d_prev = x_dim;
    for (std::size_t l = 0; l < _eh_vec.size(); ++l) {
        const int64_t d_next = _eh_vec.at(l).val;
        const std::string _l = std::to_string(l + 1);
        enc->push_back("encoding_" + _l, torch::nn::Linear(d_prev, d_next));
        if (do_bn)
            enc->push_back("bn_" + _l, torch::nn::BatchNorm1d(d_next));
        enc->push_back("relu_" + _l, torch::nn::ReLU());
        d_prev = d_next;
    }

    z_repr_mean = register_module("representation_mean",
                                  torch::nn::Linear(d_prev, z_dim));

    z_repr_lnvar = register_module("representation_logvariance",
                                   torch::nn::Linear(d_prev, z_dim));
}

/// Gaussian reparameterization
///
/// Unlike a plain VAE this draws noise in the inference mode as well; the
/// stochastic samples spread the synthetic training set for the
/// downstream classifier.
/// @param mu
/// @param lnvar
torch::Tensor
encoder_tImpl::reparameterize(torch::Tensor mu, torch::Tensor lnvar)
{
    auto sig = lnvar.div(2.0).exp();     //
    auto eps = torch::randn_like(lnvar); //
    return mu + eps.mul(sig);            //
}

encoder_out_t
encoder_tImpl::forward(torch::Tensor x)
{
    auto h = enc->is_empty() ? x : enc->forward(x);
    auto mean_ = z_repr_mean->forward(h);
    auto lnvar_ = z_repr_lnvar->forward(h);
    return { mean_, lnvar_, reparameterize(mean_, lnvar_) };
}

TORCH_MODULE(encoder_t);

/////////////
// decoder //
/////////////

struct decoder_tImpl : torch::nn::Module {

    explicit decoder_tImpl(const latent_dim,
                           const std::vector<decoder_h_dim>,
                           const data_dim,
                           const bool);

    /// Decode following the module's train/eval state
    torch::Tensor forward(torch::Tensor z);

    /// Decode with an explicit mode: batch normalization uses and leaves
    /// the running statistics untouched when `inference` is set, without
    /// flipping the module state.
    torch::Tensor decode(torch::Tensor z, const bool inference);

    const int64_t z_dim;
    const int64_t x_dim;
    const bool do_bn;

    std::vector<torch::nn::Linear> dec;
    std::vector<torch::nn::BatchNorm1d> dec_bn;
    torch::nn::Linear recon { nullptr };
};

decoder_tImpl::decoder_tImpl(const latent_dim _zd,
                             const std::vector<decoder_h_dim> _dh_vec,
                             const data_dim _xd,
                             const bool _do_bn)
    : z_dim(_zd.val)
    , x_dim(_xd.val)
    , do_bn(_do_bn)
{
    // Add hidden layers between representation and x
    int64_t d_prev = z_dim;
    for (std::size_t l = 0; l < _dh_vec.size(); ++l) {
        const int64_t d_next = _dh_vec.at(l).val;
        const std::string _l = std::to_string(l + 1);
        dec.emplace_back(register_module("decoding_" + _l,
                                         torch::nn::Linear(d_prev, d_next)));
        if (do_bn)
            dec_bn.emplace_back(
                register_module("bn_" + _l, torch::nn::BatchNorm1d(d_next)));
        d_prev = d_next;
    }

    // Add final one mapping to the reconstruction
    recon = register_module("reconstruction", torch::nn::Linear(d_prev, x_dim));
}

torch::Tensor
decoder_tImpl::forward(torch::Tensor z)
{
    return decode(z, !is_training());
}

torch::Tensor
decoder_tImpl::decode(torch::Tensor z, const bool inference)
{
    namespace F = torch::nn::functional;
    auto h = z;
    for (std::size_t l = 0; l < dec.size(); ++l) {
        h = dec.at(l)->forward(h);
        if (do_bn) {
            auto &bn = dec_bn.at(l);
            h = F::batch_norm(h,
                              bn->running_mean,
                              bn->running_var,
                              F::BatchNormFuncOptions()
                                  .weight(bn->weight)
                                  .bias(bn->bias)
                                  .training(!inference));
        }
        h = torch::relu(h);
    }
    return recon->forward(h);
}

TORCH_MODULE(decoder_t);

///////////////////////////////
// multi-modal VAE (CADA-VAE) //
///////////////////////////////

struct modality_spec_t {
    std::string name;
    int64_t dim;
    std::vector<int64_t> encoding_layers;
    std::vector<int64_t> decoding_layers;
};

struct cada_vae_out_t {
    tensor_dict_t recon;
    tensor_dict_t mean;
    tensor_dict_t lnvar;
    tensor_dict_t sample;
};

struct cada_vae_tImpl : torch::nn::Module {

    explicit cada_vae_tImpl(const std::vector<modality_spec_t> &,
                            const latent_dim,
                            const bool);

    /// Encode every modality, decode its own sample
    cada_vae_out_t forward(const tensor_dict_t &x);

    encoder_out_t encode(const std::string &modality, torch::Tensor x);

    torch::Tensor decode(const std::string &modality,
                         torch::Tensor z,
                         const bool inference);

    /// Decoders bound to the given mode; they share parameters with this
    /// module, so gradients flow back into it.
    decoder_dict_t decoder_functions(const bool inference);

    const std::vector<std::string> &modalities() const { return modality_vec; }
    int64_t dim_latent() const { return z_dim; }
    int64_t dim_data(const std::string &m) const { return x_dims.at(m); }

    const int64_t z_dim;
    const bool do_bn;

private:
    void check_modality(const std::string &modality) const;

    template <typename VEC, typename DIM>
    std::vector<DIM> _copy_dim_vec(const VEC &src);

    std::map<std::string, encoder_t> encoders;
    std::map<std::string, decoder_t> decoders;
    std::map<std::string, int64_t> x_dims;
    std::vector<std::string> modality_vec; // sorted
};

/// Build the network
cada_vae_tImpl::cada_vae_tImpl(const std::vector<modality_spec_t> &specs,
                               const latent_dim _zd,
                               const bool _do_bn = false)
    : z_dim(_zd.val)
    , do_bn(_do_bn)
{
    ASSERT(specs.size() > 0, "need at least one modality");

    for (const auto &ss : specs) {
        ASSERT(x_dims.count(ss.name) == 0, "duplicate modality: " << ss.name);

        auto henc = _copy_dim_vec<std::vector<int64_t>, encoder_h_dim>(
            ss.encoding_layers);
        auto hdec = _copy_dim_vec<std::vector<int64_t>, decoder_h_dim>(
            ss.decoding_layers);

        encoders.emplace(ss.name,
                         register_module("encoder_" + ss.name,
                                         encoder_t(data_dim(ss.dim),
                                                   henc,
                                                   _zd,
                                                   do_bn)));

        decoders.emplace(ss.name,
                         register_module("decoder_" + ss.name,
                                         decoder_t(_zd,
                                                   hdec,
                                                   data_dim(ss.dim),
                                                   do_bn)));
        x_dims[ss.name] = ss.dim;
    }

    modality_vec = modality_keys(x_dims);
}

cada_vae_out_t
cada_vae_tImpl::forward(const tensor_dict_t &x)
{
    check_modalities(modality_vec, x, "model input");

    cada_vae_out_t ret;

    for (const auto &m : modality_vec) {
        auto enc_ = encode(m, x.at(m));
        ret.recon[m] = decode(m, enc_.sample, !is_training());
        ret.mean[m] = enc_.mean;
        ret.lnvar[m] = enc_.lnvar;
        ret.sample[m] = enc_.sample;
    }

    return ret;
}

encoder_out_t
cada_vae_tImpl::encode(const std::string &modality, torch::Tensor x)
{
    check_modality(modality);
    ASSERT(x.dim() == 2 && x.size(1) == x_dims.at(modality),
           "expected N x " << x_dims.at(modality) << " input for "
                           << modality);
    return encoders.at(modality)->forward(x);
}

torch::Tensor
cada_vae_tImpl::decode(const std::string &modality,
                       torch::Tensor z,
                       const bool inference)
{
    check_modality(modality);
    return decoders.at(modality)->decode(z, inference);
}

decoder_dict_t
cada_vae_tImpl::decoder_functions(const bool inference)
{
    decoder_dict_t ret;
    for (const auto &m : modality_vec) {
        std::shared_ptr<decoder_tImpl> dec = decoders.at(m).ptr();
        ret[m] = [dec, inference](torch::Tensor z) {
            return dec->decode(z, inference);
        };
    }
    return ret;
}

void
cada_vae_tImpl::check_modality(const std::string &modality) const
{
    ASSERT(x_dims.count(modality) > 0, "unknown modality: " << modality);
}

//////////////////////
// helper functions //
//////////////////////

template <typename VEC, typename DIM>
std::vector<DIM>
cada_vae_tImpl::_copy_dim_vec(const VEC &src)
{
    std::vector<DIM> dst;
    std::transform(src.begin(),
                   src.end(),
                   std::back_inserter(dst),
                   [](const int64_t x) { return DIM(x); });
    return dst;
}

TORCH_MODULE(cada_vae_t); // expose cada_vae_t

/// IMG and CLS_ATTR networks from the command-line options
std::vector<modality_spec_t>
make_modality_specs(const cada_vae_options_t &opt,
                    const int64_t img_dim,
                    const int64_t attr_dim)
{
    return { { IMG, img_dim, opt.img_encoding_layers, opt.img_decoding_layers },
             { CLS_ATTR,
               attr_dim,
               opt.attr_encoding_layers,
               opt.attr_decoding_layers } };
}

} // namespace
#endif
