#include "cadavae.hh"
#include "modality.hh"

#include <eigen3/Eigen/Core>
#include <map>

#ifndef CADAVAE_IO_DATA_HH_
#define CADAVAE_IO_DATA_HH_

namespace cadavae {

using Scalar = float;
using Index = std::ptrdiff_t;
using Mat =
    Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

void
write_tensor(const std::string file_, torch::Tensor param_)
{
    using Vec = Eigen::Matrix<float, Eigen::Dynamic, 1>;

    torch::Tensor _param = param_.detach().to(torch::kCPU, torch::kFloat32);
    _param = _param.contiguous();

    if (_param.dim() == 2) {
        Eigen::Map<Mat> param(_param.data_ptr<float>(),
                              _param.size(0),
                              _param.size(1));
        write_data_file(file_, param);
    } else if (_param.dim() < 2) {
        Eigen::Map<Vec> param(_param.data_ptr<float>(), _param.numel());
        write_data_file(file_, param);
    }
}

/////////////////////////////////////////////
// Multi-modal data kept in memory; dense  //
// batches are copied out row by row       //
/////////////////////////////////////////////

struct dense_data_block_t {

    using Index = std::ptrdiff_t;
    using Scalar = float;
    using data_map_t = std::map<std::string, Mat>;

    explicit dense_data_block_t(const data_map_t &_data,
                                const std::vector<int64_t> &_labels,
                                const Index batch_size);

    const Index B; // block size

    Index size() const { return B; }
    Index ntot() const { return N; }
    Index nfeature(const std::string &m) const { return data.at(m).cols(); }

    std::vector<std::string> modalities() const { return modality_keys(data); }

    /// Populate the memory with the rows
    /// @param subrow at most B row indexes
    void read(const std::vector<Index> &subrow);
    void clear();

    /// @returns torch tensor (rows x feature) of this modality
    torch::Tensor torch_tensor(const std::string &m);

    /// @returns all modalities
    tensor_dict_t torch_tensor_dict();

    /// @returns class ids (rows)
    torch::Tensor torch_labels();

private:
    Index N;                                       // # total samples
    Index nrow;                                    // # rows read in
    data_map_t data;                               // modality -> N x D
    std::vector<int64_t> labels;                   // N class ids
    std::map<std::string, std::vector<Scalar>> mem; // temporary data holder
    std::vector<int64_t> mem_label;                //
};

dense_data_block_t::dense_data_block_t(const data_map_t &_data,
                                       const std::vector<int64_t> &_labels,
                                       const Index batch_size)
    : B(batch_size)
    , N(_labels.size())
    , nrow(0)
    , data(_data)
    , labels(_labels)
{
    ASSERT(B > 0, "need a positive batch size");
    ASSERT(N > 0, "empty data block");
    ASSERT(data.size() > 0, "need at least one modality");

    for (const auto &pp : data) {
        ASSERT(pp.second.rows() == N,
               pp.first << " has " << pp.second.rows() << " rows; but "
                        << N << " labels");
        mem[pp.first].resize(B * pp.second.cols());
        std::fill(std::begin(mem[pp.first]), std::end(mem[pp.first]), 0.);
    }

    mem_label.resize(B);
    std::fill(std::begin(mem_label), std::end(mem_label), 0);
}

void
dense_data_block_t::read(const std::vector<Index> &subrow)
{
    ASSERT(subrow.size() > 0 && subrow.size() <= B,
           "Need 1 to " << B << " rows, but " << subrow.size());

    nrow = subrow.size();

    for (auto &pp : data) {
        const Mat &X = pp.second;
        const Index D = X.cols();
        std::vector<Scalar> &mem_vec = mem.at(pp.first);

        for (Index j = 0; j < nrow; ++j) {
            const Index r = subrow.at(j);
            ASSERT(r >= 0 && r < N, "row " << r << " out of " << N);
            Eigen::Map<Mat>(mem_vec.data() + j * D, 1, D) = X.row(r);
        }
    }

    for (Index j = 0; j < nrow; ++j) {
        mem_label[j] = labels.at(subrow.at(j));
    }
}

void
dense_data_block_t::clear()
{
    for (auto &pp : mem)
        std::fill(std::begin(pp.second), std::end(pp.second), 0);
    std::fill(std::begin(mem_label), std::end(mem_label), 0);
    nrow = 0;
}

torch::Tensor
dense_data_block_t::torch_tensor(const std::string &m)
{
    ASSERT(data.count(m) > 0, "no modality " << m << " in this block");
    auto options = torch::TensorOptions().dtype(torch::kFloat32);
    // copy out so that the batch survives clear()
    return torch::from_blob(mem.at(m).data(), { nrow, nfeature(m) }, options)
        .clone();
}

tensor_dict_t
dense_data_block_t::torch_tensor_dict()
{
    tensor_dict_t ret;
    for (const auto &pp : data)
        ret[pp.first] = torch_tensor(pp.first);
    return ret;
}

torch::Tensor
dense_data_block_t::torch_labels()
{
    auto options = torch::TensorOptions().dtype(torch::kLong);
    return torch::from_blob(mem_label.data(), { nrow }, options).clone();
}

//////////////////////////
// zero-shot data split //
//////////////////////////

struct zsl_data_t {
    Mat train_img;                    // seen-class instances
    std::vector<int64_t> train_label; // their class ids
    Mat test_img;                     // test instances
    std::vector<int64_t> test_label;  // their class ids
    Mat class_attr;                   // class x attribute (row = class id)
    std::vector<int64_t> unseen;      // unseen class ids
};

int
read_zsl_data(const cadavae_options_t &opt, zsl_data_t &data)
{
    ERR_RET(read_data_file(opt.train_img, data.train_img) != EXIT_SUCCESS,
            "failed to read " << opt.train_img);
    ERR_RET(read_vector_file(opt.train_label, data.train_label) !=
                EXIT_SUCCESS,
            "failed to read " << opt.train_label);
    ERR_RET(read_data_file(opt.test_img, data.test_img) != EXIT_SUCCESS,
            "failed to read " << opt.test_img);
    ERR_RET(read_vector_file(opt.test_label, data.test_label) != EXIT_SUCCESS,
            "failed to read " << opt.test_label);
    ERR_RET(read_data_file(opt.class_attr, data.class_attr) != EXIT_SUCCESS,
            "failed to read " << opt.class_attr);
    ERR_RET(read_vector_file(opt.unseen, data.unseen) != EXIT_SUCCESS,
            "failed to read " << opt.unseen);

    ERR_RET(data.train_img.rows() != data.train_label.size(),
            "#train features " << data.train_img.rows() << " vs. #labels "
                               << data.train_label.size());
    ERR_RET(data.test_img.rows() != data.test_label.size(),
            "#test features " << data.test_img.rows() << " vs. #labels "
                              << data.test_label.size());
    ERR_RET(data.train_img.cols() != data.test_img.cols(),
            "train and test features differ in dimensionality");

    TLOG("Train: " << data.train_img.rows() << " x " << data.train_img.cols());
    TLOG("Test: " << data.test_img.rows() << " x " << data.test_img.cols());
    TLOG("Class attributes: " << data.class_attr.rows() << " x "
                              << data.class_attr.cols());
    TLOG("Unseen classes: " << data.unseen.size());

    return EXIT_SUCCESS;
}

/// Attribute rows of the classes
/// @param class_attr class x attribute
/// @param classes class ids
Mat
gather_class_rows(const Mat &class_attr, const std::vector<int64_t> &classes)
{
    Mat ret(classes.size(), class_attr.cols());
    for (std::size_t j = 0; j < classes.size(); ++j) {
        const int64_t k = classes.at(j);
        ASSERT(k >= 0 && k < class_attr.rows(),
               "class " << k << " outside the attribute table ("
                        << class_attr.rows() << " classes)");
        ret.row(j) = class_attr.row(k);
    }
    return ret;
}

/// Seen-class training data: IMG and the CLS_ATTR of each instance's class
dense_data_block_t
make_train_block(const zsl_data_t &data, const Index batch_size)
{
    dense_data_block_t::data_map_t dmap;
    dmap[IMG] = data.train_img;
    dmap[CLS_ATTR] = gather_class_rows(data.class_attr, data.train_label);
    return dense_data_block_t(dmap, data.train_label, batch_size);
}

/// Each unseen class's attribute vector repeated `nrep` times
dense_data_block_t
make_unseen_attr_block(const zsl_data_t &data,
                       const int64_t nrep,
                       const Index batch_size)
{
    ASSERT(nrep > 0, "need positive repeats per unseen class");
    std::vector<int64_t> classes;
    classes.reserve(data.unseen.size() * nrep);
    for (auto k : data.unseen)
        for (int64_t r = 0; r < nrep; ++r)
            classes.emplace_back(k);

    dense_data_block_t::data_map_t dmap;
    dmap[CLS_ATTR] = gather_class_rows(data.class_attr, classes);
    return dense_data_block_t(dmap, classes, batch_size);
}

/// Test instances: IMG only
dense_data_block_t
make_test_block(const zsl_data_t &data, const Index batch_size)
{
    dense_data_block_t::data_map_t dmap;
    dmap[IMG] = data.test_img;
    return dense_data_block_t(dmap, data.test_label, batch_size);
}

} // namespace

#endif
