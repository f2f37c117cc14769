#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "cadavae_io.hh"
#include "embedding.hh"
#include "models/cada_vae.hh"

#include <cstdio>

using namespace cadavae;

namespace {

/// 5 classes; 0-2 seen, 3-4 unseen
zsl_data_t
make_zsl_data()
{
    zsl_data_t data;
    data.train_img = Mat::Random(10, 6);
    data.train_label = { 0, 1, 2, 0, 1, 2, 0, 1, 2, 0 };
    data.test_img = Mat::Random(5, 6);
    data.test_label = { 4, 3, 3, 4, 4 };
    data.class_attr = Mat::Random(5, 3);
    data.unseen = { 3, 4 };
    return data;
}

cada_vae_t
make_small_model()
{
    std::vector<modality_spec_t> specs { { IMG, 6, { 8 }, { 8 } },
                                         { CLS_ATTR, 3, { 5 }, { 5 } } };
    return cada_vae_t(specs, latent_dim(4), true);
}

std::vector<int64_t>
to_vector(torch::Tensor t)
{
    torch::Tensor _t = t.to(torch::kCPU, torch::kLong).contiguous();
    return std::vector<int64_t>(_t.data_ptr<int64_t>(),
                                _t.data_ptr<int64_t>() + _t.numel());
}

} // namespace

TEST_CASE("class ids are remapped to positions in the class list",
          "[embedding]")
{
    const std::vector<int64_t> classes { 7, 12, 19 };

    auto labels = torch::tensor(std::vector<int64_t> { 7, 12, 19 });
    CHECK(to_vector(remap_labels(labels, classes)) ==
          std::vector<int64_t> { 0, 1, 2 });

    auto shuffled = torch::tensor(std::vector<int64_t> { 19, 7, 7, 12 });
    CHECK(to_vector(remap_labels(shuffled, classes)) ==
          std::vector<int64_t> { 2, 0, 0, 1 });

    auto unknown = torch::tensor(std::vector<int64_t> { 7, 8 });
    CHECK_THROWS_AS(remap_labels(unknown, classes), fatal_error);
}

TEST_CASE("index ranges", "[embedding]")
{
    const index_range_t r { 3, 7 };
    CHECK(r.size() == 4);
}

TEST_CASE("test rows are embedded by the latent mean", "[embedding]")
{
    torch::manual_seed(31);
    zsl_data_t data = make_zsl_data();
    cada_vae_t model = make_small_model();
    dense_data_block_t test_block = make_test_block(data, 2);

    const torch::Device cpu(torch::kCPU);

    torch::Tensor e1, e2, y1, n1, n2, y2;
    std::tie(e1, y1) = eval_vae(model, test_block, IMG, cpu, false);
    std::tie(e2, y2) = eval_vae(model, test_block, IMG, cpu, false);
    std::tie(n1, y1) = eval_vae(model, test_block, IMG, cpu);
    std::tie(n2, y2) = eval_vae(model, test_block, IMG, cpu);

    CHECK(e1.sizes() == torch::IntArrayRef({ 5, 4 }));
    CHECK(torch::allclose(e1, e2));
    CHECK_FALSE(torch::allclose(n1, n2));
    CHECK(to_vector(y1) == data.test_label);
    CHECK_FALSE(model->is_training());
}

TEST_CASE("synthetic dataset in the generalized setting", "[embedding]")
{
    torch::manual_seed(32);
    zsl_data_t data = make_zsl_data();
    cada_vae_t model = make_small_model();

    std::vector<torch::Tensor> before;
    for (const auto &p : model->parameters())
        before.emplace_back(p.detach().clone());

    dense_data_block_t seen_block = make_train_block(data, 4);
    dense_data_block_t unseen_block = make_unseen_attr_block(data, 3, 4);
    dense_data_block_t test_block = make_test_block(data, 4);

    const embedding_options_t opt { true, torch::Device(torch::kCPU) };

    const synthetic_dataset_t ds = generate_synthetic_dataset(model,
                                                              seen_block,
                                                              unseen_block,
                                                              test_block,
                                                              data.unseen,
                                                              opt);

    REQUIRE(ds.size() == 10 + 6 + 5);
    CHECK(ds.embedding.size(0) == ds.size());
    CHECK(ds.embedding.size(1) == 4);

    CHECK(ds.train.lb == 0);
    CHECK(ds.train.ub == 16);
    CHECK(ds.test.lb == ds.train.ub);
    CHECK(ds.test.ub == ds.size());
    CHECK(ds.train.size() + ds.test.size() == ds.size());

    const auto labels = to_vector(ds.label);
    const std::vector<int64_t> seen(labels.begin(), labels.begin() + 10);
    const std::vector<int64_t> attr(labels.begin() + 10, labels.begin() + 16);
    const std::vector<int64_t> test(labels.begin() + 16, labels.end());

    CHECK(seen == data.train_label);
    CHECK(attr == std::vector<int64_t> { 3, 3, 3, 4, 4, 4 });
    CHECK(test == data.test_label);

    const auto after = model->parameters();
    for (std::size_t j = 0; j < before.size(); ++j)
        CHECK(torch::equal(before.at(j), after.at(j)));
}

TEST_CASE("synthetic dataset in the zero-shot setting", "[embedding]")
{
    torch::manual_seed(33);
    zsl_data_t data = make_zsl_data();
    cada_vae_t model = make_small_model();

    dense_data_block_t seen_block = make_train_block(data, 4);
    dense_data_block_t unseen_block = make_unseen_attr_block(data, 2, 4);
    dense_data_block_t test_block = make_test_block(data, 4);

    const embedding_options_t opt { false, torch::Device(torch::kCPU) };

    const synthetic_dataset_t ds = generate_synthetic_dataset(model,
                                                              seen_block,
                                                              unseen_block,
                                                              test_block,
                                                              data.unseen,
                                                              opt);

    REQUIRE(ds.size() == 4 + 5);
    CHECK(ds.train.lb == 0);
    CHECK(ds.train.ub == 4);
    CHECK(ds.test.lb == 4);
    CHECK(ds.test.ub == 9);

    // unseen attributes remapped, test rows keep their class ids
    CHECK(to_vector(ds.label) ==
          std::vector<int64_t> { 0, 0, 1, 1, 4, 3, 3, 4, 4 });

    SECTION("written to disk")
    {
        const std::string hdr = "embedding_test";
        write_synthetic_dataset(hdr, ds);

        Mat emb;
        REQUIRE(read_data_file(hdr + ".zsl_emb.gz", emb) == EXIT_SUCCESS);
        CHECK(emb.rows() == 9);
        CHECK(emb.cols() == 4);

        std::vector<int64_t> labels;
        REQUIRE(read_vector_file(hdr + ".zsl_label.gz", labels) ==
                EXIT_SUCCESS);
        CHECK(labels == to_vector(ds.label));

        std::vector<std::string> split;
        REQUIRE(read_vector_file(hdr + ".zsl_split.gz", split) ==
                EXIT_SUCCESS);
        CHECK(split ==
              std::vector<std::string> { "train", "0", "4", "test", "4", "9" });

        for (auto ext : { ".zsl_emb.gz", ".zsl_label.gz", ".zsl_split.gz" })
            std::remove((hdr + ext).c_str());
    }
}

TEST_CASE("test labels pass through unchanged in zero-shot", "[embedding]")
{
    torch::manual_seed(34);
    zsl_data_t data = make_zsl_data();
    data.test_label = { 1, 3, 0, 4, 2 }; // seen classes among the test rows
    cada_vae_t model = make_small_model();

    dense_data_block_t seen_block = make_train_block(data, 4);
    dense_data_block_t unseen_block = make_unseen_attr_block(data, 1, 4);
    dense_data_block_t test_block = make_test_block(data, 4);

    const embedding_options_t opt { false, torch::Device(torch::kCPU) };

    const synthetic_dataset_t ds = generate_synthetic_dataset(model,
                                                              seen_block,
                                                              unseen_block,
                                                              test_block,
                                                              data.unseen,
                                                              opt);

    REQUIRE(ds.size() == 2 + 5);
    CHECK(to_vector(ds.label) ==
          std::vector<int64_t> { 0, 1, 1, 3, 0, 4, 2 });

    SECTION("an unseen attribute outside the class list is still fatal")
    {
        zsl_data_t bad = make_zsl_data();
        dense_data_block_t bad_unseen = make_unseen_attr_block(bad, 1, 4);
        const std::vector<int64_t> classes { 3 };
        CHECK_THROWS_AS(generate_synthetic_dataset(model,
                                                   seen_block,
                                                   bad_unseen,
                                                   test_block,
                                                   classes,
                                                   opt),
                        fatal_error);
    }
}
