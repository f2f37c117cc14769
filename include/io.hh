////////////////////////////////////////////////////////////////
// I/O routines
#include <cctype>
#include <cmath>
#include <eigen3/Eigen/Core>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "gzstream.h"
#include "utils/util.hh"

#ifndef CADAVAE_IO_HH_
#define CADAVAE_IO_HH_

bool
file_exists(std::string filename)
{
    std::ifstream f(filename.c_str());
    return f.good();
}

bool
all_files_exist(std::vector<std::string> filenames)
{
    bool ret = true;
    for (auto f : filenames) {
        if (!file_exists(f)) {
            TLOG(std::left << std::setw(10) << "Missing: " << std::setw(30)
                           << f);
            ret = false;
        } else {
            TLOG(std::left << std::setw(10) << "Found: " << std::setw(30)
                           << f);
        }
    }
    return ret;
}

/////////////////////////////////
// common utility for data I/O //
/////////////////////////////////

bool
is_file_gz(const std::string filename)
{
    if (filename.size() < 3)
        return false;
    return filename.substr(filename.size() - 3) == ".gz";
}

template <typename IFS, typename T>
auto
read_vector_stream(IFS &ifs, std::vector<T> &in)
{
    in.clear();
    T v;
    while (ifs >> v) {
        in.push_back(v);
    }
    ERR_RET(in.size() == 0, "empty vector");
    return EXIT_SUCCESS;
}

template <typename T>
auto
read_vector_file(const std::string filename, std::vector<T> &in)
{
    auto ret = EXIT_SUCCESS;

    if (is_file_gz(filename)) {
        igzstream ifs(filename.c_str(), std::ios::in);
        ret = read_vector_stream(ifs, in);
        ifs.close();
    } else {
        std::ifstream ifs(filename.c_str(), std::ios::in);
        ret = read_vector_stream(ifs, in);
        ifs.close();
    }
    return ret;
}

///////////////////
// simple writer //
///////////////////

template <typename OFS, typename Vec>
void
write_pair_stream(OFS &ofs, const Vec &vec)
{

    for (auto pp : vec) {
        ofs << std::get<0>(pp) << " " << std::get<1>(pp) << std::endl;
    }
}

template <typename Vec>
void
write_pair_file(const std::string filename, const Vec &out)
{
    if (is_file_gz(filename)) {
        ogzstream ofs(filename.c_str(), std::ios::out);
        write_pair_stream(ofs, out);
        ofs.close();
    } else {
        std::ofstream ofs(filename.c_str(), std::ios::out);
        write_pair_stream(ofs, out);
        ofs.close();
    }
}

template <typename OFS, typename Vec>
void
write_vector_stream(OFS &ofs, const Vec &vec)
{

    for (auto pp : vec) {
        ofs << pp << std::endl;
    }
}

template <typename Vec>
void
write_vector_file(const std::string filename, const Vec &out)
{
    if (is_file_gz(filename)) {
        ogzstream ofs(filename.c_str(), std::ios::out);
        write_vector_stream(ofs, out);
        ofs.close();
    } else {
        std::ofstream ofs(filename.c_str(), std::ios::out);
        write_vector_stream(ofs, out);
        ofs.close();
    }
}

/////////////////////////
// dense matrix reader //
/////////////////////////

template <typename IFS, typename T>
auto
read_data_stream(IFS &ifs, T &in)
{
    using elem_t = typename T::Scalar;
    using RowMat =
        Eigen::Matrix<elem_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    std::vector<elem_t> data;
    std::string line;

    std::size_t nr = 0; // number of rows
    std::size_t nc = 0; // number of columns
    std::size_t nmissing = 0;

    while (std::getline(ifs, line)) {
        std::istringstream ss(line);
        std::string word;
        std::size_t ncol_line = 0;
        while (ss >> word) {
            elem_t val;
            try {
                val = static_cast<elem_t>(std::stod(word));
            } catch (const std::logic_error &) {
                val = NAN;
            }
            if (!std::isfinite(val))
                nmissing++;
            data.push_back(val);
            ++ncol_line;
        }

        if (ncol_line == 0) // skip empty lines
            continue;

        if (nr == 0)
            nc = ncol_line;

        ERR_RET(ncol_line != nc,
                "line " << (nr + 1) << " has " << ncol_line
                        << " columns; expected " << nc);
        nr++;
    }

    ERR_RET(nr < 1, "empty file");

    if (nmissing > 0) {
        WLOG("Found " << nmissing << " missing values");
    }

    in = Eigen::Map<RowMat>(data.data(), nr, nc);

    return EXIT_SUCCESS;
}

////////////////////////////////////////////////////////////////
template <typename T>
auto
read_data_file(const std::string filename, T &in)
{
    auto ret = EXIT_SUCCESS;

    if (is_file_gz(filename)) {
        igzstream ifs(filename.c_str(), std::ios::in);
        ret = read_data_stream(ifs, in);
        ifs.close();
    } else {
        std::ifstream ifs(filename.c_str(), std::ios::in);
        ret = read_data_stream(ifs, in);
        ifs.close();
    }

    return ret;
}

////////////////////////////////////////////////////////////////
template <typename OFS, typename Derived>
void
write_data_stream(OFS &ofs, const Eigen::MatrixBase<Derived> &out)
{

    const Derived &M = out.derived();
    using Index = typename Derived::Index;

    for (Index r = 0u; r < M.rows(); ++r) {
        ofs << M.coeff(r, 0);
        for (Index c = 1u; c < M.cols(); ++c)
            ofs << " " << M.coeff(r, c);
        ofs << std::endl;
    }
}

////////////////////////////////////////////////////////////////
template <typename T>
void
write_data_file(const std::string filename, const T &out)
{
    if (is_file_gz(filename)) {
        ogzstream ofs(filename.c_str(), std::ios::out);
        write_data_stream(ofs, out);
        ofs.close();
    } else {
        std::ofstream ofs(filename.c_str(), std::ios::out);
        write_data_stream(ofs, out);
        ofs.close();
    }
}

#endif
