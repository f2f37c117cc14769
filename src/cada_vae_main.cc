#include "cadavae.hh"
#include "cadavae_io.hh"
#include "cadavae_alg.hh"
#include "cada_vae_procedure.hh"
#include "embedding.hh"
#include "warmup.hh"
#include "models/cada_vae.hh"

int
run_cada_vae(const int argc, const char *argv[])
{
    using namespace cadavae;

    zsl_config_t cfg;

    CHK(parse_cadavae_options(argc, argv, cfg.main));
    CHK(parse_training_options(argc, argv, cfg.train));
    CHK(parse_cada_vae_options(argc, argv, cfg.network));
    CHK(parse_warmup_options(argc, argv, cfg.warmup));

    const zsl_registry_t registry = make_zsl_registry();

    if (cfg.main.help) {
        std::cerr << "[--model choices]\n\n";
        for (const auto &name : registry.names())
            std::cerr << name << "\n";
        std::cerr << std::endl;
        return EXIT_SUCCESS;
    }

    const zsl_procedure_t &procedure = registry.get(cfg.main.model);

    zsl_data_t data;
    CHK(read_zsl_data(cfg.main, data));

    TLOG("Running " << cfg.main.model << " ("
                    << (cfg.main.generalized ? "generalized" : "zero-shot")
                    << " setting)");

    zsl_result_t result = procedure(cfg, data);

    write_synthetic_dataset(cfg.main.out, result.dataset);
    write_loss_history(cfg.main.out + ".loss_history.gz", result.history);

    TLOG("Wrote " << cfg.main.out << ".zsl_{emb,label,split}.gz");
    TLOG("Done");
    return EXIT_SUCCESS;
}

int
main(const int argc, const char *argv[])
{
    try {
        return run_cada_vae(argc, argv);
    } catch (const std::exception &e) {
        ELOG(e.what());
    }
    return EXIT_FAILURE;
}
