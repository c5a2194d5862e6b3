#include "util/BoostUtil.hpp"

namespace boost_util {

std::vector<int> get_set_indices(const boost::dynamic_bitset<>& bitset) {
  std::vector<int> indices;
  indices.reserve(bitset.count());
  for (auto i = bitset.find_first(); i != boost::dynamic_bitset<>::npos; i = bitset.find_next(i)) {
    indices.push_back(i);
  }
  return indices;
}

}  // namespace boost_util
