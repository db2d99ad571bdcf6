// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <iterator>
#include <boost/core/ignore_unused.hpp>

namespace geodist::utils
{
// for ranges of std::future, only picked for real iterators,
// two futures passed on their own go to the variadic overload.
template <typename It,
  typename = typename std::iterator_traits<It>::iterator_category>
void wait_for_all(It beg, It end)
{
  for (auto it = beg; it != end; ++it) {
    it->wait();
  }
}

template <typename... Fut>
void wait_for_all(Fut&... futures) {
  bool dummy[] = { (futures.wait(), true)... };
  boost::ignore_unused(dummy);
}
}  // namespace geodist::utils
