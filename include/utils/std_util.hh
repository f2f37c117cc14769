#include <algorithm>
#include <cstring>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef CADAVAE_STD_UTIL_HH_
#define CADAVAE_STD_UTIL_HH_

char *
str2char(const std::string &s)
{
    char *ret = new char[s.size() + 1];
    std::strcpy(ret, s.c_str());
    return ret;
}

std::vector<std::string>
split(const std::string &s, char delim)
{
    std::stringstream ss(s);
    std::string item;
    std::vector<std::string> elems;
    while (std::getline(ss, item, delim)) {
        elems.push_back(std::move(item));
    }
    return elems;
}

/**
 * vector -> map: name -> position index
 */
template <typename S, typename I>
std::unordered_map<S, I>
make_position_dict(const std::vector<S> &name_vec)
{

    std::unordered_map<S, I> name_to_id;

    for (I i = 0; i < name_vec.size(); ++i) {
        const S &j = name_vec.at(i);
        name_to_id[j] = i;
    }

    return name_to_id;
}

/**
 * 0, 1, ..., n-1 in a random order
 */
template <typename I, typename RNG>
std::vector<I>
random_order(const I n, RNG &rng)
{
    std::vector<I> ret(n);
    std::iota(std::begin(ret), std::end(ret), 0);
    std::shuffle(std::begin(ret), std::end(ret), rng);
    return ret;
}

/**
 * "1560,1660" -> { 1560, 1660 }
 */
std::vector<int64_t>
split_int_arr(const std::string &src)
{
    std::vector<int64_t> dst;
    auto arr = split(src, ',');
    std::transform(arr.begin(),
                   arr.end(),
                   std::back_inserter(dst),
                   [](auto s) { return std::stol(s); });
    return dst;
}

#endif
