#include "Labels.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

#include <glog/logging.h>

namespace Labels {
std::vector<std::string> split(std::string_view host)
{
  auto const host_str{std::string{host}};

  std::vector<std::string> labels;
  boost::algorithm::split(labels, host_str, boost::algorithm::is_any_of("."),
                          boost::algorithm::token_compress_on);

  labels.erase(std::remove_if(begin(labels), end(labels),
                              [](auto const& label) { return label.empty(); }),
               end(labels));

  for (auto& label : labels)
    boost::algorithm::to_lower(label);

  return labels;
}

std::string tail(std::vector<std::string> const& labels, int level)
{
  CHECK_GT(level, 0);
  CHECK_LE(static_cast<size_t>(level), labels.size());

  auto const offset = labels.size() - level;
  std::vector<std::string> const last(begin(labels) + offset, end(labels));

  return boost::algorithm::join(last, ".");
}
} // namespace Labels
