#ifndef CADAVAE_HH_
#define CADAVAE_HH_

#include <iostream>
#include "utils/util.hh"
#include "utils/std_util.hh"
#include "io.hh"

#ifndef TORCH_INC_H_     // Prevent torch
#define TORCH_INC_H_     // from reloading
#include <torch/torch.h> //
#endif                   // End of torch

#include <getopt.h>

struct cadavae_options_t {

    explicit cadavae_options_t()
    {
        // default options
        model = "cada_vae";
        batch_size = 32;
        generalized = true;
        unseen_samples = 400;
        help = false;
    }

    std::string train_img;
    std::string train_label;
    std::string test_img;
    std::string test_label;
    std::string class_attr;
    std::string unseen;
    std::string out;
    std::string model;

    int64_t batch_size;
    bool generalized;
    int64_t unseen_samples;
    bool help;
};

int
parse_cadavae_options(const int argc,
                      const char *_argv[],
                      cadavae_options_t &options)
{
    const char *_usage =
        "\n"
        "[options]\n"
        "\n"
        "--train_img      : seen-class training features (line = instance)\n"
        "--train_label    : class id of each training instance\n"
        "--test_img       : test features (line = instance)\n"
        "--test_label     : class id of each test instance\n"
        "--class_attr     : class attribute matrix (line = class id)\n"
        "--unseen         : unseen class ids\n"
        "--out            : output file header\n"
        "--model          : training procedure (default: cada_vae)\n"
        "--batch_size     : #samples in each batch (default: 32)\n"
        "--generalized    : generalized zero-shot setting (default)\n"
        "--zsl            : unseen classes only at test time\n"
        "--unseen_samples : #synthetic samples per unseen class (default: 400)\n"
        "\n";

    const char *const short_opts = "T:t:S:s:A:U:O:M:b:GZn:h";

    const option long_opts[] = {
        { "train_img", required_argument, nullptr, 'T' },      //
        { "train_label", required_argument, nullptr, 't' },    //
        { "test_img", required_argument, nullptr, 'S' },       //
        { "test_label", required_argument, nullptr, 's' },     //
        { "class_attr", required_argument, nullptr, 'A' },     //
        { "unseen", required_argument, nullptr, 'U' },         //
        { "out", required_argument, nullptr, 'O' },            //
        { "output", required_argument, nullptr, 'O' },         //
        { "model", required_argument, nullptr, 'M' },          //
        { "batch_size", required_argument, nullptr, 'b' },     //
        { "batch", required_argument, nullptr, 'b' },          //
        { "generalized", no_argument, nullptr, 'G' },          //
        { "gzsl", no_argument, nullptr, 'G' },                 //
        { "zsl", no_argument, nullptr, 'Z' },                  //
        { "unseen_samples", required_argument, nullptr, 'n' }, //
        { "help", no_argument, nullptr, 'h' },                 //
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
        case 'T':
            options.train_img = std::string(optarg);
            break;

        case 't':
            options.train_label = std::string(optarg);
            break;

        case 'S':
            options.test_img = std::string(optarg);
            break;

        case 's':
            options.test_label = std::string(optarg);
            break;

        case 'A':
            options.class_attr = std::string(optarg);
            break;

        case 'U':
            options.unseen = std::string(optarg);
            break;

        case 'O':
            options.out = std::string(optarg);
            break;

        case 'M':
            options.model = std::string(optarg);
            break;

        case 'b':
            options.batch_size = std::stol(optarg);
            break;

        case 'G':
            options.generalized = true;
            break;

        case 'Z':
            options.generalized = false;
            break;

        case 'n':
            options.unseen_samples = std::stol(optarg);
            break;

        case 'h': // -h or --help
            std::cerr << _usage << std::endl;
            options.help = true;
            for (std::size_t i = 0; i < argv_copy.size(); i++)
                delete[] argv_copy[i];

            return EXIT_SUCCESS;

        case '?': // Unrecognized option
        default:  //
                 ;
        }
    }

    for (std::size_t i = 0; i < argv_copy.size(); i++)
        delete[] argv_copy[i];

    ERR_RET(!all_files_exist({ options.train_img,
                               options.train_label,
                               options.test_img,
                               options.test_label,
                               options.class_attr,
                               options.unseen }),
            "missing input files");
    ERR_RET(options.out.size() == 0, "need output file header");
    ERR_RET(options.batch_size < 1, "need a positive batch size");
    ERR_RET(options.unseen_samples < 1, "need positive --unseen_samples");

    return EXIT_SUCCESS;
}

#endif
