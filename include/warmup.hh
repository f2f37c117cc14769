#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "utils/util.hh"
#include "utils/std_util.hh"

#ifndef CADAVAE_WARMUP_HH_
#define CADAVAE_WARMUP_HH_

namespace cadavae {

/// Piecewise-linear ramp of a loss coefficient
///
///              0                                    if t < start
/// factor(t) =  factor                               if t >= end
///              factor * (t - start) / (end - start) otherwise
///
struct warmup_ramp_t {

    explicit warmup_ramp_t(const int64_t _start,
                           const int64_t _end,
                           const float _factor)
        : start_epoch(_start)
        , end_epoch(_end)
        , factor(_factor)
    {
        ASSERT(start_epoch >= 0, "negative warm-up start: " << start_epoch);
        ASSERT(end_epoch > start_epoch,
               "warm-up needs end > start: [" << start_epoch << ", "
                                              << end_epoch << ")");
        ASSERT(factor >= 0., "negative warm-up factor: " << factor);
    }

    float operator()(const int64_t epoch) const
    {
        if (epoch < start_epoch)
            return 0.;
        if (epoch >= end_epoch)
            return factor;
        return factor * static_cast<float>(epoch - start_epoch) /
            static_cast<float>(end_epoch - start_epoch);
    }

    const int64_t start_epoch;
    const int64_t end_epoch;
    const float factor;
};

struct warmup_spec_t {
    warmup_ramp_t beta;
    warmup_ramp_t cross_reconstruction;
    warmup_ramp_t distance;
};

struct loss_factors_t {
    float beta;
    float cross_reconstruction;
    float distance;
};

/// @param epoch current epoch (0-based)
/// @param warmup
loss_factors_t
loss_factors(const int64_t epoch, const warmup_spec_t &warmup)
{
    ASSERT(epoch >= 0, "negative epoch: " << epoch);
    return { warmup.beta(epoch),
             warmup.cross_reconstruction(epoch),
             warmup.distance(epoch) };
}

//////////////////////////
// command line parsing //
//////////////////////////

struct warmup_options_t {

    explicit warmup_options_t()
    {
        // default options
        beta_factor = .25;
        beta_start = 0;
        beta_end = 93;
        cross_factor = 2.37;
        cross_start = 21;
        cross_end = 75;
        distance_factor = 8.13;
        distance_start = 6;
        distance_end = 22;
    }

    float beta_factor;
    int64_t beta_start;
    int64_t beta_end;

    float cross_factor;
    int64_t cross_start;
    int64_t cross_end;

    float distance_factor;
    int64_t distance_start;
    int64_t distance_end;
};

warmup_spec_t
make_warmup_spec(const warmup_options_t &opt)
{
    return warmup_spec_t {
        warmup_ramp_t(opt.beta_start, opt.beta_end, opt.beta_factor),
        warmup_ramp_t(opt.cross_start, opt.cross_end, opt.cross_factor),
        warmup_ramp_t(opt.distance_start,
                      opt.distance_end,
                      opt.distance_factor)
    };
}

int
parse_warmup_options(const int argc,
                     const char *_argv[],
                     warmup_options_t &options)
{
    const char *_usage =
        "[Warm-up schedule options]\n"
        "\n"
        "Each loss factor ramps linearly from 0 at ${start} epoch\n"
        "to ${factor} at ${end} epoch.\n"
        "\n"
        "Loss = recon - beta * KL + cross * CA + distance * DA\n"
        "\n"
        "--beta_factor     : KL factor (default: 0.25)\n"
        "--beta_start      : KL ramp start (default: 0)\n"
        "--beta_end        : KL ramp end (default: 93)\n"
        "--cross_factor    : cross-alignment factor (default: 2.37)\n"
        "--cross_start     : cross-alignment ramp start (default: 21)\n"
        "--cross_end       : cross-alignment ramp end (default: 75)\n"
        "--distance_factor : distribution-alignment factor (default: 8.13)\n"
        "--distance_start  : distribution-alignment ramp start (default: 6)\n"
        "--distance_end    : distribution-alignment ramp end (default: 22)\n"
        "\n";

    const char *const short_opts = "1:2:3:4:5:6:7:8:9:h";

    const option long_opts[] = {
        { "beta_factor", required_argument, nullptr, '1' },     //
        { "beta_start", required_argument, nullptr, '2' },      //
        { "beta_end", required_argument, nullptr, '3' },        //
        { "cross_factor", required_argument, nullptr, '4' },    //
        { "cross_start", required_argument, nullptr, '5' },     //
        { "cross_end", required_argument, nullptr, '6' },       //
        { "distance_factor", required_argument, nullptr, '7' }, //
        { "dist_factor", required_argument, nullptr, '7' },     //
        { "distance_start", required_argument, nullptr, '8' },  //
        { "dist_start", required_argument, nullptr, '8' },      //
        { "distance_end", required_argument, nullptr, '9' },    //
        { "dist_end", required_argument, nullptr, '9' },        //
        { "help", no_argument, nullptr, 'h' },                  //
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
        case '1':
            options.beta_factor = std::stof(optarg);
            break;

        case '2':
            options.beta_start = std::stol(optarg);
            break;

        case '3':
            options.beta_end = std::stol(optarg);
            break;

        case '4':
            options.cross_factor = std::stof(optarg);
            break;

        case '5':
            options.cross_start = std::stol(optarg);
            break;

        case '6':
            options.cross_end = std::stol(optarg);
            break;

        case '7':
            options.distance_factor = std::stof(optarg);
            break;

        case '8':
            options.distance_start = std::stol(optarg);
            break;

        case '9':
            options.distance_end = std::stol(optarg);
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

    return EXIT_SUCCESS;
}

} // namespace
#endif
