#ifndef TORCH_INC_H_     // Prevent torch
#define TORCH_INC_H_     // from reloading
#include <torch/torch.h> //
#endif                   // End of torch

#include <functional>
#include <map>
#include <string>

#include "modality.hh"
#include "warmup.hh"
#include "utils/util.hh"

#ifndef CADAVAE_LOSSES_HH_
#define CADAVAE_LOSSES_HH_

namespace cadavae {

enum class recon_norm_t { L1, L2 };

/// @param norm "l1" or "l2"
recon_norm_t
parse_recon_norm(const std::string &norm)
{
    if (norm == "l1")
        return recon_norm_t::L1;
    ASSERT(norm == "l2",
           "unknown reconstruction norm: " << norm << " (l1 or l2)");
    return recon_norm_t::L2;
}

/// latent -> reconstruction
using decoder_fn_t = std::function<torch::Tensor(torch::Tensor)>;
using decoder_dict_t = std::map<std::string, decoder_fn_t>;

/// Summed l1/l2 error divided by the number of rows (not the number of
/// elements) so modalities of different dimensionality stay comparable.
/// @param x original input (N x D)
/// @param x_recon reconstruction (N x D)
/// @param norm
torch::Tensor
reconstruction_loss(torch::Tensor x,
                    torch::Tensor x_recon,
                    const recon_norm_t norm)
{
    namespace F = torch::nn::functional;
    const float n = x.size(0);

    switch (norm) {
    case recon_norm_t::L1:
        return F::l1_loss(x_recon,
                          x,
                          F::L1LossFuncOptions().reduction(torch::kSum)) /
            n;
    case recon_norm_t::L2:
        return F::mse_loss(x_recon,
                           x,
                           F::MSELossFuncOptions().reduction(torch::kSum)) /
            n;
    }

    throw fatal_error("unknown reconstruction norm");
}

torch::Tensor
reconstruction_loss(torch::Tensor x,
                    torch::Tensor x_recon,
                    const std::string &norm)
{
    return reconstruction_loss(x, x_recon, parse_recon_norm(norm));
}

/// 0.5 * sum(1 + ln σ² - μ² - σ²), averaged over the batch
///
/// This is -KL[N(μ, σ²) || N(0, I)]; the VAE loss subtracts it.
/// @param _mean
/// @param _lnvar
torch::Tensor
kl_loss(torch::Tensor _mean, torch::Tensor _lnvar)
{
    return 0.5 * torch::sum(1 + _lnvar - _mean.pow(2) - _lnvar.exp(), 1).mean();
}

/// 2-Wasserstein distance between two diagonal Gaussians, row by row,
/// averaged over the batch
///
/// W = sqrt(|μ1 - μ2|² + |σ1 - σ2|²)
///
torch::Tensor
distribution_alignment_loss(torch::Tensor z_mu_1,
                            torch::Tensor z_lnvar_1,
                            torch::Tensor z_mu_2,
                            torch::Tensor z_lnvar_2)
{
    auto loss_mu = (z_mu_1 - z_mu_2).pow(2).sum(1);
    auto loss_var =
        (z_lnvar_1.div(2.0).exp() - z_lnvar_2.div(2.0).exp()).pow(2).sum(1);

    // round-off may push the radicand slightly below zero
    return torch::sqrt(torch::clamp_min(loss_mu + loss_var, 0.)).mean();
}

/// x1 vs. dec1(z2) and x2 vs. dec2(z1)
torch::Tensor
cross_alignment_loss(const decoder_fn_t &decoder_1,
                     const decoder_fn_t &decoder_2,
                     torch::Tensor x_1,
                     torch::Tensor x_2,
                     torch::Tensor z_sample_1,
                     torch::Tensor z_sample_2,
                     const recon_norm_t norm)
{
    auto x_recon_1 = decoder_1(z_sample_2);
    auto x_recon_2 = decoder_2(z_sample_1);

    return reconstruction_loss(x_1, x_recon_1, norm) +
        reconstruction_loss(x_2, x_recon_2, norm);
}

struct cada_losses_t {
    torch::Tensor recon; // reconstruction, summed over modalities
    torch::Tensor kld;   // -KL, summed over modalities
    torch::Tensor vae;   // recon - beta * kld
    torch::Tensor ca;    // cross alignment, summed over pairs
    torch::Tensor da;    // distribution alignment, summed over pairs
};

/// Per-modality VAE losses and pairwise alignment losses for one batch
///
/// @param decoders latent -> reconstruction for each modality
/// @param x        original input
/// @param x_recon  reconstruction
/// @param z_mu     latent mean
/// @param z_lnvar  latent log-variance
/// @param z_sample reparameterized latent sample
/// @param beta     KL factor
/// @param norm     reconstruction norm
cada_losses_t
compute_cada_losses(const decoder_dict_t &decoders,
                    const tensor_dict_t &x,
                    const tensor_dict_t &x_recon,
                    const tensor_dict_t &z_mu,
                    const tensor_dict_t &z_lnvar,
                    const tensor_dict_t &z_sample,
                    const float beta,
                    const recon_norm_t norm)
{
    const auto modalities = modality_keys(z_mu);
    ASSERT(modalities.size() > 0, "no modality to compute the losses");

    check_modalities(modalities, x, "input");
    check_modalities(modalities, x_recon, "reconstruction");
    check_modalities(modalities, z_lnvar, "latent log-variance");
    check_modalities(modalities, z_sample, "latent sample");
    check_modalities(modalities, decoders, "decoders");

    auto zero = torch::zeros({}, z_mu.begin()->second.options());

    cada_losses_t ret { zero, zero, zero, zero, zero };

    for (const auto &m : modalities) {
        ret.recon = ret.recon + reconstruction_loss(x.at(m), x_recon.at(m), norm);
        ret.kld = ret.kld + kl_loss(z_mu.at(m), z_lnvar.at(m));
    }

    ret.vae = ret.recon - beta * ret.kld;

    for (const auto &pp : modality_pairs(modalities)) {
        const auto &m1 = pp.first;
        const auto &m2 = pp.second;

        ret.da = ret.da +
            distribution_alignment_loss(z_mu.at(m1),
                                        z_lnvar.at(m1),
                                        z_mu.at(m2),
                                        z_lnvar.at(m2));

        ret.ca = ret.ca +
            cross_alignment_loss(decoders.at(m1),
                                 decoders.at(m2),
                                 x.at(m1),
                                 x.at(m2),
                                 z_sample.at(m1),
                                 z_sample.at(m2),
                                 norm);
    }

    return ret;
}

struct cada_loss_options_t {
    bool cross_reconstruction;
    bool distribution_alignment;
};

/// vae + cross * ca + distance * da
torch::Tensor
combine_cada_losses(const cada_losses_t &losses,
                    const loss_factors_t &factors,
                    const cada_loss_options_t &opt)
{
    auto loss = losses.vae;

    if (opt.cross_reconstruction)
        loss = loss + losses.ca * factors.cross_reconstruction;

    if (opt.distribution_alignment && factors.distance > 0.)
        loss = loss + losses.da * factors.distance;

    return loss;
}

} // namespace
#endif
